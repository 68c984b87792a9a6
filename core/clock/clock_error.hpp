/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace datex::clock {
  enum class ClockError {
    kBeforeGenesis = 1,
    kNonMonotonic,
    kZeroBlockDelay,
  };
}  // namespace datex::clock

OUTCOME_HPP_DECLARE_ERROR(datex::clock, ClockError);
