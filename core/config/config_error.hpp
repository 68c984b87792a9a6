/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace datex::config {

  enum class ConfigError {
    kZeroDataIdsLimit = 1,
    kNonPositiveOfferTimeout,
  };

}  // namespace datex::config

OUTCOME_HPP_DECLARE_ERROR(datex::config, ConfigError);
