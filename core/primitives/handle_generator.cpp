/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/handle_generator.hpp"

#include <algorithm>

#include "common/endian.hpp"
#include "crypto/blake2/blake2b.hpp"

namespace datex::primitives {
  Handle generateHandle(const Address &creator, Height height, uint64_t nonce) {
    Bytes suffix;
    common::putUint64BigEndian(suffix, static_cast<uint64_t>(height));
    common::putUint64BigEndian(suffix, nonce);
    const auto hash{crypto::blake2b::blake2b_256({creator, suffix})};
    Handle handle;
    std::copy_n(hash.begin(), handle.size(), handle.begin());
    return handle;
  }
}  // namespace datex::primitives
