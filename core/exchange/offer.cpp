/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "exchange/offer.hpp"

namespace datex::exchange {
  std::string toString(OfferStatus status) {
    switch (status) {
      case OfferStatus::kNeutral:
        return "NEUTRAL";
      case OfferStatus::kPending:
        return "PENDING";
      case OfferStatus::kSettled:
        return "SETTLED";
      case OfferStatus::kCanceled:
        return "CANCELED";
      case OfferStatus::kRejected:
        return "REJECTED";
    }
    return "UNKNOWN";
  }
}  // namespace datex::exchange
