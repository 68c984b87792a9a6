/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "clock/wall_clock.hpp"

namespace datex::clock {
  class WallClockMock : public WallClock {
   public:
    MOCK_CONST_METHOD0(now, UnixTime());
  };
}  // namespace datex::clock
