/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>
#include <vector>

namespace datex {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = gsl::span<const uint8_t>;
  using BytesOut = gsl::span<uint8_t>;

  /// View of the characters of `str` as raw bytes
  inline BytesIn asBytes(std::string_view str) {
    return gsl::make_span(reinterpret_cast<const uint8_t *>(str.data()),
                          str.size());
  }

  /// Appends `tail` to the end of `bytes`
  inline void append(Bytes &bytes, BytesIn tail) {
    bytes.insert(bytes.end(), tail.begin(), tail.end());
  }
}  // namespace datex
