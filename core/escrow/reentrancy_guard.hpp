/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace datex::escrow {

  /// "Operation in progress" flag of a component
  class ReentrancyFlag {
   public:
    bool entered() const {
      return entered_;
    }

   private:
    friend class ReentrancyGuard;

    bool entered_{false};
  };

  /**
   * Holds the flag set for its lifetime. The flag is cleared on every exit
   * path of the scope owning the guard.
   */
  class ReentrancyGuard {
   public:
    /**
     * Sets the flag
     * @return guard or EscrowError::kReentrantCall if the flag is already set
     */
    static outcome::result<ReentrancyGuard> enter(ReentrancyFlag &flag);

    ReentrancyGuard(ReentrancyGuard &&other) noexcept;
    ReentrancyGuard(const ReentrancyGuard &) = delete;
    ReentrancyGuard &operator=(const ReentrancyGuard &) = delete;
    ReentrancyGuard &operator=(ReentrancyGuard &&) = delete;

    ~ReentrancyGuard();

   private:
    explicit ReentrancyGuard(ReentrancyFlag *flag);

    ReentrancyFlag *flag_;
  };

}  // namespace datex::escrow
