/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/reentrancy_guard.hpp"

#include <gtest/gtest.h>

#include "escrow/escrow_error.hpp"
#include "testutil/outcome.hpp"

namespace datex::escrow {

  /**
   * @given flag held by a guard
   * @when guard is entered again
   * @then reentrant call error until the first guard is destroyed
   */
  TEST(ReentrancyGuardTest, NestedEnterFails) {
    ReentrancyFlag flag;
    {
      EXPECT_OUTCOME_TRUE(guard, ReentrancyGuard::enter(flag));
      EXPECT_TRUE(flag.entered());
      EXPECT_OUTCOME_ERROR(EscrowError::kReentrantCall,
                           ReentrancyGuard::enter(flag));
      EXPECT_TRUE(flag.entered());
    }
    EXPECT_FALSE(flag.entered());
    EXPECT_OUTCOME_TRUE_1(ReentrancyGuard::enter(flag));
    EXPECT_FALSE(flag.entered());
  }

  /**
   * @given guard
   * @when scope exits with exception
   * @then flag is cleared
   */
  TEST(ReentrancyGuardTest, ClearedOnException) {
    ReentrancyFlag flag;
    EXPECT_THROW(
        {
          auto guard{ReentrancyGuard::enter(flag)};
          ASSERT_TRUE(guard);
          throw std::runtime_error{"failure"};
        },
        std::runtime_error);
    EXPECT_FALSE(flag.entered());
  }

  /**
   * @given guard moved to another owner
   * @when moved-from guard is destroyed
   * @then flag stays set until the new owner is destroyed
   */
  TEST(ReentrancyGuardTest, Move) {
    ReentrancyFlag flag;
    boost::optional<ReentrancyGuard> holder;
    {
      auto guard{ReentrancyGuard::enter(flag)};
      ASSERT_TRUE(guard);
      holder.emplace(std::move(guard.value()));
    }
    EXPECT_TRUE(flag.entered());
    holder.reset();
    EXPECT_FALSE(flag.entered());
  }

}  // namespace datex::escrow
