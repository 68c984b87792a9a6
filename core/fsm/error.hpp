/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace datex::fsm {

  enum class FsmError {
    /// no rule is registered for the event at all
    kUnknownEvent = 1,
    /// event has rules, none of them starts in the current state
    kTransitionNotAllowed,
  };

}  // namespace datex::fsm

OUTCOME_HPP_DECLARE_ERROR(datex::fsm, FsmError);
