/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1/secp256k1_provider_impl.hpp"

#include <secp256k1_recovery.h>

#include "crypto/secp256k1/secp256k1_error.hpp"

namespace datex::crypto::secp256k1 {

  Secp256k1ProviderImpl::Secp256k1ProviderImpl()
      : context_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                          | SECP256K1_CONTEXT_VERIFY),
                 secp256k1_context_destroy) {}

  outcome::result<PublicKey> Secp256k1ProviderImpl::derive(
      const PrivateKey &key) const {
    secp256k1_pubkey pubkey;
    if (!secp256k1_ec_pubkey_create(context_.get(), &pubkey, key.data())) {
      return Secp256k1Error::kInvalidPrivateKey;
    }
    return serialize(pubkey);
  }

  outcome::result<Signature> Secp256k1ProviderImpl::sign(
      const MessageHash &message, const PrivateKey &key) const {
    secp256k1_ecdsa_recoverable_signature sig_struct;
    if (!secp256k1_ecdsa_sign_recoverable(context_.get(),
                                          &sig_struct,
                                          message.data(),
                                          key.data(),
                                          secp256k1_nonce_function_rfc6979,
                                          nullptr)) {
      return Secp256k1Error::kSignFailed;
    }
    Signature signature;
    int recid = 0;
    if (!secp256k1_ecdsa_recoverable_signature_serialize_compact(
            context_.get(), signature.data(), &recid, &sig_struct)) {
      return Secp256k1Error::kSerializeFailed;
    }
    signature[64] = static_cast<uint8_t>(recid);
    return signature;
  }

  outcome::result<PublicKey> Secp256k1ProviderImpl::recoverPublicKey(
      const MessageHash &message, const Signature &signature) const {
    if (signature[64] > 3) {
      return Secp256k1Error::kMalformedSignature;
    }
    secp256k1_ecdsa_recoverable_signature sig_rec;
    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(
            context_.get(), &sig_rec, signature.data(), signature[64])) {
      return Secp256k1Error::kMalformedSignature;
    }
    secp256k1_pubkey pubkey;
    if (!secp256k1_ecdsa_recover(
            context_.get(), &pubkey, &sig_rec, message.data())) {
      return Secp256k1Error::kRecoverFailed;
    }
    return serialize(pubkey);
  }

  outcome::result<PublicKey> Secp256k1ProviderImpl::serialize(
      const secp256k1_pubkey &pubkey) const {
    PublicKey public_key;
    size_t outputlen = public_key.size();
    if (!secp256k1_ec_pubkey_serialize(context_.get(),
                                       public_key.data(),
                                       &outputlen,
                                       &pubkey,
                                       SECP256K1_EC_UNCOMPRESSED)) {
      return Secp256k1Error::kSerializeFailed;
    }
    return public_key;
  }

}  // namespace datex::crypto::secp256k1
