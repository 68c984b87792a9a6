/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <initializer_list>

#include "common/blob.hpp"

namespace datex::crypto::blake2b {

  constexpr size_t kBlake2b160HashLength = 20;  // 160 bit
  constexpr size_t kBlake2b256HashLength = 32;  // 256 bit

  using Blake2b160Hash = common::Blob<kBlake2b160HashLength>;
  using Blake2b256Hash = common::Blob<kBlake2b256HashLength>;

  /**
   * Incremental BLAKE2b hashing context (RFC 7693), unkeyed
   */
  class Ctx {
   public:
    /// @param outlen - digest length in bytes, 1..64
    explicit Ctx(size_t outlen);

    void update(BytesIn in);

    /// Writes digest to hash, hash size must be not less than outlen
    void final(BytesOut hash);

   private:
    void compress(bool last);

    std::array<uint8_t, 128> buffer_{};
    std::array<uint64_t, 8> state_{};
    std::array<uint64_t, 2> counter_{};
    size_t filled_{};
    size_t outlen_{};
  };

  /**
   * @brief Get blake2b-160 hash
   * @param to_hash - data to hash
   * @return hash
   */
  Blake2b160Hash blake2b_160(BytesIn to_hash);

  /**
   * @brief Get blake2b-256 hash
   * @param to_hash - data to hash
   * @return hash
   */
  Blake2b256Hash blake2b_256(BytesIn to_hash);

  /// blake2b-256 of concatenation of parts
  Blake2b256Hash blake2b_256(std::initializer_list<BytesIn> parts);

}  // namespace datex::crypto::blake2b
