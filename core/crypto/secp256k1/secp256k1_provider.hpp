/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "crypto/secp256k1/secp256k1_types.hpp"

namespace datex::crypto::secp256k1 {

  /**
   * Recoverable ECDSA over prehashed messages:
   * - public key in uncompressed form
   * - signature in compact format with recovery id
   */
  class Secp256k1Provider {
   public:
    virtual ~Secp256k1Provider() = default;

    /**
     * @brief Generate public key from private key
     * @param key - private key for deriving public key
     * @return Derived public key or error code
     */
    virtual outcome::result<PublicKey> derive(const PrivateKey &key) const = 0;

    /**
     * @brief Create signature for a message hash
     * @param message - hash of signed data
     * @param key - private key for signing
     * @return recoverable signature or error code
     */
    virtual outcome::result<Signature> sign(const MessageHash &message,
                                            const PrivateKey &key) const = 0;

    /**
     * Returns the public key of the signer.
     * @param message - hash of signed data
     * @param signature - recoverable signature
     * @return public key of signer or error code
     */
    virtual outcome::result<PublicKey> recoverPublicKey(
        const MessageHash &message, const Signature &signature) const = 0;
  };

}  // namespace datex::crypto::secp256k1
