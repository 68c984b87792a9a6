/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock_error.hpp"
#include "clock/logical_clock.hpp"

namespace datex::clock {
  /**
   * Manually driven clock, deterministic source of heights for tests and
   * scripted runs
   */
  class CounterClock : public LogicalClock {
   public:
    explicit CounterClock(Height initial = 0);

    Height height() const override;

    /// Moves clock forward by ticks
    void advance(Height ticks = 1);

    /// Sets clock to height, fails if height is behind current one
    outcome::result<void> set(Height height);

   private:
    Height height_;
  };
}  // namespace datex::clock
