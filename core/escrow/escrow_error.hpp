/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace datex::escrow {

  enum class EscrowError {
    kHandlerNotFound = 1,
    kHandlerAlreadyRegistered,
    kReentrantCall,
    kUnknownException,
  };

}  // namespace datex::escrow

OUTCOME_HPP_DECLARE_ERROR(datex::escrow, EscrowError);
