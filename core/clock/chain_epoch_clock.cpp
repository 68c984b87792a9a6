/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/chain_epoch_clock.hpp"

namespace datex::clock {
  ChainEpochClock::ChainEpochClock(UnixTime genesis_time, UnixTime block_delay)
      : genesis_time_{genesis_time}, block_delay_{block_delay} {}

  UnixTime ChainEpochClock::genesisTime() const {
    return genesis_time_;
  }

  outcome::result<Height> ChainEpochClock::epochAtTime(UnixTime time) const {
    if (block_delay_.count() <= 0) {
      return ClockError::kZeroBlockDelay;
    }
    if (time < genesis_time_) {
      return ClockError::kBeforeGenesis;
    }
    return (time - genesis_time_).count() / block_delay_.count();
  }
}  // namespace datex::clock
