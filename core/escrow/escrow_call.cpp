/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/escrow_call.hpp"

#include <algorithm>

#include "crypto/blake2/blake2b.hpp"

namespace datex::escrow {
  Selector makeSelector(std::string_view signature) {
    auto hash = crypto::blake2b::blake2b_256(asBytes(signature));
    Selector selector;
    std::copy_n(hash.begin(), selector.size(), selector.begin());
    return selector;
  }
}  // namespace datex::escrow
