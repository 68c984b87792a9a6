/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1/secp256k1_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(datex::crypto::secp256k1, Secp256k1Error, e) {
  using datex::crypto::secp256k1::Secp256k1Error;
  switch (e) {
    case Secp256k1Error::kInvalidPrivateKey:
      return "Secp256k1Error: private key is out of range";
    case Secp256k1Error::kSignFailed:
      return "Secp256k1Error: signing failed";
    case Secp256k1Error::kMalformedSignature:
      return "Secp256k1Error: signature or recovery id is malformed";
    case Secp256k1Error::kRecoverFailed:
      return "Secp256k1Error: no public key recovers the signature";
    case Secp256k1Error::kSerializeFailed:
      return "Secp256k1Error: serialization failed";
  }
  return "Secp256k1Error: unknown error";
}
