/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/epoch_clock.hpp"

namespace datex::clock {
  EpochClock::EpochClock(std::shared_ptr<WallClock> wall_clock,
                         ChainEpochClock epoch_clock)
      : wall_clock_{std::move(wall_clock)}, epoch_clock_{epoch_clock} {}

  Height EpochClock::height() const {
    auto epoch{epoch_clock_.epochAtTime(wall_clock_->now())};
    if (epoch && epoch.value() > last_) {
      last_ = epoch.value();
    }
    return last_;
  }
}  // namespace datex::clock
