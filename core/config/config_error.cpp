/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/config_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(datex::config, ConfigError, e) {
  using E = datex::config::ConfigError;
  switch (e) {
    case E::kZeroDataIdsLimit:
      return "ConfigError: max-data-ids must be positive";
    case E::kNonPositiveOfferTimeout:
      return "ConfigError: offer-timeout must be positive";
  }
  return "ConfigError: unknown error";
}
