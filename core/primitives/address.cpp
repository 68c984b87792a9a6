/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address.hpp"

#include "crypto/blake2/blake2b.hpp"

namespace datex::primitives {
  Address makeAddress(const crypto::secp256k1::PublicKey &public_key) {
    return Address{crypto::blake2b::blake2b_160(public_key)};
  }
}  // namespace datex::primitives
