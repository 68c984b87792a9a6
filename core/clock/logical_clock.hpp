/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/types.hpp"

namespace datex::clock {
  using primitives::Height;

  /**
   * Monotonic ordering source, replaces ledger height
   */
  class LogicalClock {
   public:
    virtual ~LogicalClock() = default;

    /// Current height, never decreases
    virtual Height height() const = 0;
  };
}  // namespace datex::clock
