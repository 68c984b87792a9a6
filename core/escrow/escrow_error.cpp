/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/escrow_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(datex::escrow, EscrowError, e) {
  using E = datex::escrow::EscrowError;
  switch (e) {
    case E::kHandlerNotFound:
      return "EscrowError: settlement handler not found";
    case E::kHandlerAlreadyRegistered:
      return "EscrowError: settlement handler already registered";
    case E::kReentrantCall:
      return "EscrowError: reentrant call";
    case E::kUnknownException:
      return "EscrowError: settlement handler threw unknown exception";
  }
  return "EscrowError: unknown error";
}
