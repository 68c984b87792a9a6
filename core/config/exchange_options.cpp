/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/exchange_options.hpp"

#include <boost/program_options.hpp>

#include "config/config_error.hpp"

namespace datex::config {
  namespace po = boost::program_options;

  options_description exchangeOptions(exchange::ExchangeConfig &config) {
    options_description desc("Exchange options");
    auto option{desc.add_options()};
    option("max-data-ids",
           po::value(&config.max_data_ids)
               ->default_value(config.max_data_ids),
           "max number of data ids in one offer");
    option("offer-timeout",
           po::value(&config.offer_timeout)
               ->default_value(config.offer_timeout),
           "clock ticks between order and expiry of an offer");
    option("enforce-expiry",
           po::bool_switch(&config.enforce_expiry),
           "reject settle and reject of expired offers");
    return desc;
  }

  outcome::result<void> validate(const exchange::ExchangeConfig &config) {
    if (config.max_data_ids == 0) {
      return ConfigError::kZeroDataIdsLimit;
    }
    if (config.offer_timeout <= 0) {
      return ConfigError::kNonPositiveOfferTimeout;
    }
    return outcome::success();
  }
}  // namespace datex::config
