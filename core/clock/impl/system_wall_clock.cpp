/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/system_wall_clock.hpp"

namespace datex::clock {
  UnixTime SystemWallClock::now() const {
    return std::chrono::time_point_cast<UnixTime>(
               std::chrono::system_clock::now())
        .time_since_epoch();
  }
}  // namespace datex::clock
