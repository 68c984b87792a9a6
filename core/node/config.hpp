/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "common/logger.hpp"
#include "exchange/exchange_config.hpp"

namespace datex::node {

  enum class ClockMode {
    /// height advanced by the scenario itself
    kCounter,
    /// height derived from wall time and block delay
    kWall,
  };

  enum class Scenario {
    /// consumer pays and gets the bundle
    kSettle,
    /// escrow fails, offer stays pending
    kRevert,
    /// provider withdraws the offer
    kCancel,
    /// consumer declines the offer
    kReject,
  };

  struct Config {
    spdlog::level::level_enum log_level{spdlog::level::info};
    boost::optional<std::string> log_file;
    exchange::ExchangeConfig exchange;
    ClockMode clock_mode{ClockMode::kCounter};
    /** Genesis time in seconds, wall clock only */
    int64_t genesis_time{0};
    /** Seconds per height, wall clock only */
    int64_t block_delay{30};
    Scenario scenario{Scenario::kSettle};
    /** Number of data ids bundled by the scenario */
    size_t data_ids{20};
    /** Tokens paid on settlement */
    uint64_t price{100};

    /**
     * Reads command line and optional config file.
     * Throws on invalid options.
     */
    static Config read(int argc, char *argv[]);
  };
}  // namespace datex::node
