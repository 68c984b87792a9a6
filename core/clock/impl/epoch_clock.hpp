/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "clock/chain_epoch_clock.hpp"
#include "clock/logical_clock.hpp"
#include "clock/wall_clock.hpp"

namespace datex::clock {
  /**
   * Height derived from wall time. Time before genesis reads as height 0, the
   * reported height never goes back even if wall time does.
   */
  class EpochClock : public LogicalClock {
   public:
    EpochClock(std::shared_ptr<WallClock> wall_clock,
               ChainEpochClock epoch_clock);

    Height height() const override;

   private:
    std::shared_ptr<WallClock> wall_clock_;
    ChainEpochClock epoch_clock_;
    mutable Height last_{0};
  };
}  // namespace datex::clock
