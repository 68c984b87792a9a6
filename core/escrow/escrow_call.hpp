/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "primitives/types.hpp"

namespace datex::escrow {
  using primitives::Address;
  using primitives::OfferId;
  using primitives::Selector;

  /**
   * Generic call into a settlement handler: method selector and arguments
   * encoded by the offer creator
   */
  struct EscrowCall {
    Selector selector;
    Bytes args;
  };

  /**
   * Selector of a method is the first 4 bytes of blake2b-256 of its
   * signature, e.g. "transact(address,uint256,bytes8)"
   */
  Selector makeSelector(std::string_view signature);
}  // namespace datex::escrow
