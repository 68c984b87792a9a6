/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/wall_clock.hpp"

namespace datex::clock {
  /// Wall time of std::chrono::system_clock, truncated to seconds
  class SystemWallClock : public WallClock {
   public:
    UnixTime now() const override;
  };
}  // namespace datex::clock
