/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace datex::crypto::secp256k1 {

  constexpr size_t kPrivateKeyLength = 32;
  constexpr size_t kPublicKeyUncompressedLength = 65;
  constexpr size_t kSignatureLength = 65;

  using PrivateKey = common::Blob<kPrivateKeyLength>;
  using PublicKey = common::Blob<kPublicKeyUncompressedLength>;
  /**
   * Compact ECDSA signature format with a 65-byte signature with the recovery
   * id at the end
   */
  using Signature = common::Blob<kSignatureLength>;
  /// Only prehashed messages are signed
  using MessageHash = common::Hash256;

}  // namespace datex::crypto::secp256k1
