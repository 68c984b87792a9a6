/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace datex::common {

  enum class UnhexError {
    kNotEnoughInput = 1,
    kNonHexInput,
  };

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes - input bytes
   * @return hex string without 0x prefix
   */
  std::string hex_lower(BytesIn bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex - hex string, optional 0x prefix is skipped
   * @return decoded bytes or UnhexError
   */
  outcome::result<Bytes> unhex(std::string_view hex);
}  // namespace datex::common

OUTCOME_HPP_DECLARE_ERROR(datex::common, UnhexError);
