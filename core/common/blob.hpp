/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <string>
#include <string_view>

#include <boost/container_hash/hash.hpp>

#include "common/bytes.hpp"
#include "common/hexutil.hpp"
#include "common/outcome.hpp"

namespace datex::common {

  /**
   * Error codes for blob construction
   */
  enum class BlobError { kIncorrectLength = 1 };

  /**
   * Fixed-size byte array, base for hashes, addresses and handles
   * @tparam size_ - size of the array in bytes
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
   public:
    using Base = std::array<uint8_t, size_>;

    static constexpr size_t size() {
      return size_;
    }

    /// Initialize blob value with zeroes
    constexpr Blob() : Base{} {}

    /// Initialize blob from bytes array
    explicit constexpr Blob(const Base &array) : Base{array} {}

    /// Lowercase hex representation without prefix
    std::string toHex() const {
      return hex_lower(*this);
    }

    /**
     * Create blob from span of bytes
     * @param span - bytes, size must be exactly size_
     */
    static outcome::result<Blob<size_>> fromSpan(BytesIn span) {
      if (static_cast<size_t>(span.size()) != size_) {
        return BlobError::kIncorrectLength;
      }
      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }

    /**
     * Create blob from hex string
     * @param hex - hex string, optionally prefixed with 0x
     */
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return fromSpan(bytes);
    }
  };

  using Hash256 = Blob<32>;
}  // namespace datex::common

template <size_t N>
struct std::hash<datex::common::Blob<N>> {
  size_t operator()(const datex::common::Blob<N> &blob) const {
    return boost::hash_range(blob.begin(), blob.end());
  }
};

OUTCOME_HPP_DECLARE_ERROR(datex::common, BlobError);
