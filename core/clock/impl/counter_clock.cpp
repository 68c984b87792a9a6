/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/counter_clock.hpp"

namespace datex::clock {
  CounterClock::CounterClock(Height initial) : height_{initial} {}

  Height CounterClock::height() const {
    return height_;
  }

  void CounterClock::advance(Height ticks) {
    if (ticks > 0) {
      height_ += ticks;
    }
  }

  outcome::result<void> CounterClock::set(Height height) {
    if (height < height_) {
      return ClockError::kNonMonotonic;
    }
    height_ = height;
    return outcome::success();
  }
}  // namespace datex::clock
