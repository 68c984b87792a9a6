/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fsm/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(datex::fsm, FsmError, e) {
  using datex::fsm::FsmError;
  switch (e) {
    case FsmError::kUnknownEvent:
      return "FsmError: event has no transition rules";
    case FsmError::kTransitionNotAllowed:
      return "FsmError: event is not allowed in the current state";
  }
  return "FsmError: unknown error";
}
