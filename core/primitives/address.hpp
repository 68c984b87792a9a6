/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/secp256k1/secp256k1_types.hpp"
#include "primitives/types.hpp"

namespace datex::primitives {
  /**
   * Derives address of a key owner as blake2b-160 of uncompressed public key
   * @param public_key - secp256k1 public key
   */
  Address makeAddress(const crypto::secp256k1::PublicKey &public_key);
}  // namespace datex::primitives
