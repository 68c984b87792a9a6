/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/error_text.hpp"

#include <gtest/gtest.h>

#include "common/logger.hpp"

namespace datex {

  /**
   * @given text errors
   * @when they are created at different call sites
   * @then message is the text, equal texts give equal codes
   */
  TEST(ErrorTextTest, Message) {
    const auto first{ERROR_TEXT("escrow reverted")};
    const auto second{ERROR_TEXT("escrow reverted")};
    const auto other{ERROR_TEXT("out of funds")};
    EXPECT_EQ(first.message(), "escrow reverted");
    EXPECT_EQ(other.message(), "out of funds");
    EXPECT_EQ(first, second);
    EXPECT_NE(first, other);
    EXPECT_EQ(&first.category(), &error_text::category());
  }

  /**
   * @given level letters
   * @when converted
   * @then spdlog levels, unknown letter is info
   */
  TEST(LoggerTest, LogLevelFromChar) {
    EXPECT_EQ(common::logLevelFromChar('e'), spdlog::level::err);
    EXPECT_EQ(common::logLevelFromChar('w'), spdlog::level::warn);
    EXPECT_EQ(common::logLevelFromChar('d'), spdlog::level::debug);
    EXPECT_EQ(common::logLevelFromChar('t'), spdlog::level::trace);
    EXPECT_EQ(common::logLevelFromChar('x'), spdlog::level::info);
  }

  /**
   * @given tag
   * @when logger is created twice
   * @then the same logger is returned
   */
  TEST(LoggerTest, SameLoggerForTag) {
    auto logger{common::createLogger("test")};
    EXPECT_EQ(logger, common::createLogger("test"));
    EXPECT_EQ(logger->name(), "test");
  }

}  // namespace datex
