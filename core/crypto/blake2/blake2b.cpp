/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/blake2/blake2b.hpp"

#include <stdexcept>

namespace datex::crypto::blake2b {
  namespace {
    constexpr std::array<uint64_t, 8> kIv{
        0x6A09E667F3BCC908,
        0xBB67AE8584CAA73B,
        0x3C6EF372FE94F82B,
        0xA54FF53A5F1D36F1,
        0x510E527FADE682D1,
        0x9B05688C2B3E6C1F,
        0x1F83D9ABFB41BD6B,
        0x5BE0CD19137E2179,
    };

    constexpr std::array<std::array<uint8_t, 16>, 12> kSigma{{
        {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15},
        {14, 10, 4, 8, 9, 15, 13, 6, 1, 12, 0, 2, 11, 7, 5, 3},
        {11, 8, 12, 0, 5, 2, 15, 13, 10, 14, 3, 6, 7, 1, 9, 4},
        {7, 9, 3, 1, 13, 12, 11, 14, 2, 6, 5, 10, 4, 0, 15, 8},
        {9, 0, 5, 7, 2, 4, 10, 15, 14, 1, 11, 12, 6, 8, 3, 13},
        {2, 12, 6, 10, 0, 11, 8, 3, 4, 13, 7, 5, 15, 14, 1, 9},
        {12, 5, 1, 15, 14, 13, 4, 10, 0, 7, 6, 3, 9, 2, 8, 11},
        {13, 11, 7, 14, 12, 1, 3, 9, 5, 0, 15, 4, 8, 6, 2, 10},
        {6, 15, 14, 9, 11, 3, 0, 8, 12, 2, 13, 7, 1, 4, 10, 5},
        {10, 2, 8, 4, 7, 6, 1, 5, 15, 11, 9, 14, 3, 12, 13, 0},
        {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15},
        {14, 10, 4, 8, 9, 15, 13, 6, 1, 12, 0, 2, 11, 7, 5, 3},
    }};

    inline uint64_t rotr64(uint64_t x, unsigned n) {
      return (x >> n) | (x << (64 - n));
    }

    inline uint64_t load64(const uint8_t *p) {
      uint64_t v{0};
      for (auto i{0}; i < 8; ++i) {
        v |= static_cast<uint64_t>(p[i]) << (8 * i);
      }
      return v;
    }

    inline void mix(std::array<uint64_t, 16> &v,
                    size_t a,
                    size_t b,
                    size_t c,
                    size_t d,
                    uint64_t x,
                    uint64_t y) {
      v[a] = v[a] + v[b] + x;
      v[d] = rotr64(v[d] ^ v[a], 32);
      v[c] = v[c] + v[d];
      v[b] = rotr64(v[b] ^ v[c], 24);
      v[a] = v[a] + v[b] + y;
      v[d] = rotr64(v[d] ^ v[a], 16);
      v[c] = v[c] + v[d];
      v[b] = rotr64(v[b] ^ v[c], 63);
    }
  }  // namespace

  Ctx::Ctx(size_t outlen) : state_{kIv}, outlen_{outlen} {
    if (outlen == 0 || outlen > 64) {
      throw std::invalid_argument{"blake2b: digest length must be 1..64"};
    }
    state_[0] ^= 0x01010000 ^ outlen;
  }

  void Ctx::update(BytesIn in) {
    for (auto byte : in) {
      if (filled_ == buffer_.size()) {
        counter_[0] += filled_;
        if (counter_[0] < filled_) {
          ++counter_[1];
        }
        compress(false);
        filled_ = 0;
      }
      buffer_[filled_++] = byte;
    }
  }

  void Ctx::compress(bool last) {
    std::array<uint64_t, 16> v{};
    std::array<uint64_t, 16> m{};
    for (size_t i{0}; i < 8; ++i) {
      v[i] = state_[i];
      v[i + 8] = kIv[i];
    }
    v[12] ^= counter_[0];
    v[13] ^= counter_[1];
    if (last) {
      v[14] = ~v[14];
    }
    for (size_t i{0}; i < 16; ++i) {
      m[i] = load64(&buffer_[8 * i]);
    }
    for (const auto &s : kSigma) {
      mix(v, 0, 4, 8, 12, m[s[0]], m[s[1]]);
      mix(v, 1, 5, 9, 13, m[s[2]], m[s[3]]);
      mix(v, 2, 6, 10, 14, m[s[4]], m[s[5]]);
      mix(v, 3, 7, 11, 15, m[s[6]], m[s[7]]);
      mix(v, 0, 5, 10, 15, m[s[8]], m[s[9]]);
      mix(v, 1, 6, 11, 12, m[s[10]], m[s[11]]);
      mix(v, 2, 7, 8, 13, m[s[12]], m[s[13]]);
      mix(v, 3, 4, 9, 14, m[s[14]], m[s[15]]);
    }
    for (size_t i{0}; i < 8; ++i) {
      state_[i] ^= v[i] ^ v[i + 8];
    }
  }

  void Ctx::final(BytesOut hash) {
    if (static_cast<size_t>(hash.size()) < outlen_) {
      throw std::length_error{"blake2b: output buffer is too small"};
    }
    counter_[0] += filled_;
    if (counter_[0] < filled_) {
      ++counter_[1];
    }
    std::fill(buffer_.begin() + filled_, buffer_.end(), 0);
    filled_ = buffer_.size();
    compress(true);
    for (size_t i{0}; i < outlen_; ++i) {
      hash[i] = static_cast<uint8_t>(state_[i >> 3] >> (8 * (i & 7)));
    }
  }

  Blake2b160Hash blake2b_160(BytesIn to_hash) {
    Blake2b160Hash res;
    Ctx ctx{res.size()};
    ctx.update(to_hash);
    ctx.final(res);
    return res;
  }

  Blake2b256Hash blake2b_256(BytesIn to_hash) {
    Blake2b256Hash res;
    Ctx ctx{res.size()};
    ctx.update(to_hash);
    ctx.final(res);
    return res;
  }

  Blake2b256Hash blake2b_256(std::initializer_list<BytesIn> parts) {
    Blake2b256Hash res;
    Ctx ctx{res.size()};
    for (const auto &part : parts) {
      ctx.update(part);
    }
    ctx.final(res);
    return res;
  }

}  // namespace datex::crypto::blake2b
