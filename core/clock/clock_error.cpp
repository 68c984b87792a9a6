/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/clock_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(datex::clock, ClockError, e) {
  using datex::clock::ClockError;
  switch (e) {
    case ClockError::kBeforeGenesis:
      return "ClockError: time is before genesis";
    case ClockError::kNonMonotonic:
      return "ClockError: clock cannot move backwards";
    case ClockError::kZeroBlockDelay:
      return "ClockError: block delay must be positive";
  }
  return "ClockError: unknown error";
}
