/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/chain_epoch_clock.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

namespace datex::clock {

  class ChainEpochClockTest : public ::testing::Test {
   public:
    UnixTime genesis{1000};
    ChainEpochClock clock{genesis, UnixTime{30}};
  };

  /**
   * @given genesis time
   * @when converting time before it
   * @then error
   */
  TEST_F(ChainEpochClockTest, BeforeGenesis) {
    EXPECT_EQ(clock.genesisTime(), genesis);
    EXPECT_OUTCOME_ERROR(ClockError::kBeforeGenesis,
                         clock.epochAtTime(genesis - UnixTime{1}));
  }

  /**
   * @given genesis time and block delay
   * @when converting times after genesis
   * @then one height per block delay
   */
  TEST_F(ChainEpochClockTest, EpochAtTime) {
    EXPECT_OUTCOME_EQ(clock.epochAtTime(genesis), 0);
    EXPECT_OUTCOME_EQ(clock.epochAtTime(genesis + UnixTime{29}), 0);
    EXPECT_OUTCOME_EQ(clock.epochAtTime(genesis + UnixTime{30}), 1);
    EXPECT_OUTCOME_EQ(clock.epochAtTime(genesis + UnixTime{95}), 3);
  }

  /**
   * @given zero block delay
   * @when converting time
   * @then error
   */
  TEST(ChainEpochClockZeroDelayTest, ZeroBlockDelay) {
    ChainEpochClock clock{UnixTime{0}, UnixTime{0}};
    EXPECT_OUTCOME_ERROR(ClockError::kZeroBlockDelay,
                         clock.epochAtTime(UnixTime{10}));
  }

}  // namespace datex::clock
