/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace datex::crypto::secp256k1 {

  enum class Secp256k1Error {
    kInvalidPrivateKey = 1,
    kSignFailed,
    kMalformedSignature,
    kRecoverFailed,
    kSerializeFailed,
  };

}  // namespace datex::crypto::secp256k1

OUTCOME_HPP_DECLARE_ERROR(datex::crypto::secp256k1, Secp256k1Error);
