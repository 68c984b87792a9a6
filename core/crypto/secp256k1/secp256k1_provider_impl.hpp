/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <secp256k1.h>

#include "crypto/secp256k1/secp256k1_provider.hpp"

namespace datex::crypto::secp256k1 {

  /**
   * Secp256k1 provider over libsecp256k1, NO digest function
   */
  class Secp256k1ProviderImpl : public Secp256k1Provider {
   public:
    Secp256k1ProviderImpl();

    outcome::result<PublicKey> derive(const PrivateKey &key) const override;

    outcome::result<Signature> sign(const MessageHash &message,
                                    const PrivateKey &key) const override;

    outcome::result<PublicKey> recoverPublicKey(
        const MessageHash &message, const Signature &signature) const override;

   private:
    outcome::result<PublicKey> serialize(const secp256k1_pubkey &pubkey) const;

    std::unique_ptr<secp256k1_context, void (*)(secp256k1_context *)> context_;
  };

}  // namespace datex::crypto::secp256k1
