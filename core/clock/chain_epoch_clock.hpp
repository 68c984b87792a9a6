/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock_error.hpp"
#include "clock/time.hpp"
#include "primitives/types.hpp"

namespace datex::clock {
  using primitives::Height;

  /**
   * Converts UTC time to height, one height per block delay since genesis
   */
  class ChainEpochClock {
   public:
    ChainEpochClock(UnixTime genesis_time, UnixTime block_delay);

    UnixTime genesisTime() const;

    outcome::result<Height> epochAtTime(UnixTime time) const;

   private:
    UnixTime genesis_time_;
    UnixTime block_delay_;
  };
}  // namespace datex::clock
