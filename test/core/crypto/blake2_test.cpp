/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/blake2/blake2b.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"

namespace datex::crypto::blake2b {

  // Deterministic sequences (Fibonacci generator).
  static Bytes selftestSeq(size_t len, size_t seed) {
    auto a = static_cast<uint32_t>(0xDEAD4BAD * seed);  // prime
    uint32_t b = 1;
    Bytes out(len);
    for (auto &byte : out) {
      const uint32_t t = a + b;
      a = b;
      b = t;
      byte = static_cast<uint8_t>((t >> 24) & 0xFF);
    }
    return out;
  }

  TEST(Blake2bTest, Correctness) {
    // hash of hash results
    const auto expected{
        "681f345ad53c6360214ea500fd259edddbca775f605fad81b9b189d6d88e15c6"_unhex};
    const size_t md_len[4] = {20, 32, 48, 64};
    const size_t in_len[6] = {0, 3, 128, 129, 255, 1024};

    Ctx ctx{32};
    for (auto outlen : md_len) {
      for (auto inlen : in_len) {
        Ctx one{outlen};
        one.update(selftestSeq(inlen, inlen));
        Bytes md(outlen);
        one.final(md);
        ctx.update(md);
      }
    }
    Bytes md(32);
    ctx.final(md);
    EXPECT_EQ(md, expected);
  }

  /**
   * @given RFC 7693 appendix A input "abc"
   * @when blake2b-512 is computed
   * @then digest matches the RFC
   */
  TEST(Blake2bTest, Rfc7693) {
    Ctx ctx{64};
    ctx.update("616263"_unhex);
    Bytes md(64);
    ctx.final(md);
    EXPECT_EQ(
        md,
        "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d17d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923"_unhex);
  }

  /**
   * @given empty input
   * @when blake2b-256 and blake2b-160 are computed
   * @then known digests
   */
  TEST(Blake2bTest, Empty) {
    EXPECT_EQ(
        blake2b_256(Bytes{}),
        "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8"_hash256);
    EXPECT_EQ(blake2b_160("616263"_unhex),
              "384264f676f39536840523f284921cdc68b6846b"_blob20);
  }

  /**
   * @given input longer than several blocks
   * @when it is hashed in uneven chunks and as a list of parts
   * @then digests equal the one-shot digest
   */
  TEST(Blake2bTest, Chunked) {
    Bytes data;
    for (auto i = 0; i < 3; ++i) {
      for (auto b = 0; b < 256; ++b) {
        data.push_back(static_cast<uint8_t>(b));
      }
    }
    const auto expected{
        "b8007121274217790e2923e0ad7027986e5a99d5531ef6ae7d294140fc81615d"_hash256};
    EXPECT_EQ(blake2b_256(data), expected);

    Ctx ctx{32};
    BytesIn in{data};
    for (size_t chunk : {1, 127, 128, 129, 300}) {
      ctx.update(in.first(chunk));
      in = in.subspan(chunk);
    }
    ctx.update(in);
    Blake2b256Hash hash;
    ctx.final(hash);
    EXPECT_EQ(hash, expected);

    const BytesIn all{data};
    EXPECT_EQ(blake2b_256({all.first(200), all.subspan(200)}), expected);
  }

  /**
   * @given unsupported digest length
   * @when context is created
   * @then exception is thrown
   */
  TEST(Blake2bTest, InvalidLength) {
    EXPECT_THROW(Ctx{0}, std::invalid_argument);
    EXPECT_THROW(Ctx{65}, std::invalid_argument);
    Ctx ctx{32};
    Bytes md(16);
    EXPECT_THROW(ctx.final(md), std::length_error);
  }

}  // namespace datex::crypto::blake2b
