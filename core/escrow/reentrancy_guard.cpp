/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/reentrancy_guard.hpp"

#include "escrow/escrow_error.hpp"

namespace datex::escrow {

  outcome::result<ReentrancyGuard> ReentrancyGuard::enter(
      ReentrancyFlag &flag) {
    if (flag.entered_) {
      return EscrowError::kReentrantCall;
    }
    return ReentrancyGuard{&flag};
  }

  ReentrancyGuard::ReentrancyGuard(ReentrancyFlag *flag) : flag_{flag} {
    flag_->entered_ = true;
  }

  ReentrancyGuard::ReentrancyGuard(ReentrancyGuard &&other) noexcept
      : flag_{other.flag_} {
    other.flag_ = nullptr;
  }

  ReentrancyGuard::~ReentrancyGuard() {
    if (flag_ != nullptr) {
      flag_->entered_ = false;
    }
  }

}  // namespace datex::escrow
