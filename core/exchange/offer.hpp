/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "primitives/types.hpp"

namespace datex::exchange {
  using primitives::Address;
  using primitives::DataId;
  using primitives::Height;
  using primitives::OfferId;
  using primitives::Selector;

  /**
   * Offer lifecycle state. NEUTRAL and PENDING are the only non-final states.
   */
  enum class OfferStatus : uint8_t {
    kNeutral = 0,
    kPending,
    kSettled,
    kCanceled,
    kRejected,
  };

  std::string toString(OfferStatus status);

  /**
   * How to invoke external settlement logic, immutable after prepare
   */
  struct Escrow {
    /// address the settlement handler is registered under
    Address handler;
    /// method selector understood by the handler
    Selector sign;
    /// pre-encoded handler arguments
    Bytes args;

    bool operator==(const Escrow &other) const {
      return handler == other.handler && sign == other.sign
             && args == other.args;
    }

    bool operator!=(const Escrow &other) const {
      return not(*this == other);
    }
  };

  struct Offer {
    OfferId id;
    /// name of the offering application
    std::string provider;
    Address consumer;
    /// set of bundled content identifiers, in order of addition
    std::vector<DataId> data_ids;
    Escrow escrow;
    /// height when the offer was presented, 0 while neutral
    Height at{0};
    /// expiry boundary, at + timeout
    Height until{0};
    OfferStatus status{OfferStatus::kNeutral};
  };

  /// Identities acting on an offer
  struct OfferMembers {
    /// owner of the provider application
    Address provider;
    Address consumer;
  };
}  // namespace datex::exchange
