/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/types.hpp"

namespace datex::primitives {
  using Handle = common::Blob<8>;

  /**
   * Derives short handle from creator, clock and distinguishing value.
   * Handle is the first 8 bytes of
   * blake2b-256(creator || height_be64 || nonce_be64).
   * @param creator - address of the creator
   * @param height - current clock value
   * @param nonce - distinguishing value, zero for the first attempt
   * @return 8-byte handle
   */
  Handle generateHandle(const Address &creator, Height height, uint64_t nonce);
}  // namespace datex::primitives
