/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/time.hpp"

namespace datex::clock {
  /// Source of wall time for height derivation
  class WallClock {
   public:
    virtual ~WallClock() = default;

    virtual UnixTime now() const = 0;
  };
}  // namespace datex::clock
