/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

/**
 * Makes std::error_code carrying a constant text message.
 * Only string literals are accepted, the code is created once per call site.
 */
#define ERROR_TEXT(s)                                                   \
  [] {                                                                  \
    static_assert(sizeof(s) > 1, "error text must not be empty");       \
    static const std::error_code ec{::datex::error_text::makeErrorCode(s)}; \
    return ec;                                                          \
  }()

namespace datex::error_text {
  /// Category of errors described only by their text
  const std::error_category &category();

  /**
   * Registers message (if not yet) and returns code referring to it.
   * Prefer `ERROR_TEXT(s)` to calling this method directly.
   * @param message - null-terminated text with static storage duration
   */
  std::error_code makeErrorCode(const char *message);
}  // namespace datex::error_text
