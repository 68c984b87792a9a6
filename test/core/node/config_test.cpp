/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/config.hpp"

#include <gtest/gtest.h>
#include <boost/program_options/errors.hpp>

namespace datex::node {

  /// Reads config from args with a config file path that does not exist
  Config read(std::vector<const char *> args) {
    args.insert(args.begin(), {"datex_node", "--config", "/nonexistent.cfg"});
    return Config::read(static_cast<int>(args.size()),
                        const_cast<char **>(args.data()));
  }

  /**
   * @given scenario, clock and exchange options
   * @when config is read
   * @then values are parsed into config
   */
  TEST(NodeConfigTest, Read) {
    auto config{read({"--scenario",
                      "revert",
                      "--clock",
                      "wall",
                      "--block-delay",
                      "5",
                      "--data-ids",
                      "3",
                      "--price",
                      "7",
                      "--offer-timeout",
                      "9",
                      "-l",
                      "d"})};
    EXPECT_EQ(config.scenario, Scenario::kRevert);
    EXPECT_EQ(config.clock_mode, ClockMode::kWall);
    EXPECT_EQ(config.block_delay, 5);
    EXPECT_EQ(config.data_ids, 3);
    EXPECT_EQ(config.price, 7);
    EXPECT_EQ(config.exchange.offer_timeout, 9);
    EXPECT_EQ(config.log_level, spdlog::level::debug);
    EXPECT_FALSE(config.log_file);
  }

  /**
   * @given no options
   * @when config is read
   * @then defaults
   */
  TEST(NodeConfigTest, Defaults) {
    auto config{read({"-l", "i"})};
    EXPECT_EQ(config.scenario, Scenario::kSettle);
    EXPECT_EQ(config.clock_mode, ClockMode::kCounter);
    EXPECT_EQ(config.data_ids, 20);
    EXPECT_EQ(config.exchange.max_data_ids, 128);
  }

  /**
   * @given unknown scenario or invalid limits
   * @when config is read
   * @then exception is thrown
   */
  TEST(NodeConfigTest, Invalid) {
    EXPECT_THROW(read({"--scenario", "steal"}),
                 boost::program_options::invalid_option_value);
    EXPECT_THROW(read({"--max-data-ids", "0"}), std::system_error);
    EXPECT_THROW(read({"--block-delay", "0"}), std::invalid_argument);
  }

}  // namespace datex::node
