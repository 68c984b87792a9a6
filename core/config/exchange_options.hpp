/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options/options_description.hpp>

#include "common/outcome.hpp"
#include "exchange/exchange_config.hpp"

namespace datex::config {
  using boost::program_options::options_description;

  /**
   * Creates program option description bound to orderbook settings
   * @param config - receives parsed values, keeps defaults for absent ones
   * @return exchange option description
   */
  options_description exchangeOptions(exchange::ExchangeConfig &config);

  /// Rejects settings the orderbook can not work with
  outcome::result<void> validate(const exchange::ExchangeConfig &config);
}  // namespace datex::config
