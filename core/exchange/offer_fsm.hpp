/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "exchange/exchange_error.hpp"
#include "exchange/offer.hpp"
#include "fsm/fsm.hpp"

namespace datex::exchange {

  /**
   * Events changing an offer after it was prepared
   */
  enum class OfferEvent {
    /** provider appends data ids to a neutral offer */
    kAddDataIds = 1,
    /** provider presents offer to the consumer, countdown starts */
    kOrder,
    /** provider withdraws pending offer */
    kCancel,
    /** escrow succeeded, consumer got the bundle */
    kSettle,
    /** consumer declines pending offer */
    kReject,
  };

  struct OfferEventContext {
    Address by;
    Height at{0};
    /// used by kOrder
    Height timeout{0};
    /// used by kAddDataIds
    std::vector<DataId> data_ids;
  };

  using OfferFsm = fsm::FSM<OfferEvent, OfferEventContext, OfferStatus, Offer>;

  /**
   * Builds offer lifecycle machine:
   * NEUTRAL -> PENDING -> {SETTLED | CANCELED | REJECTED}.
   * Transitions write the destination state to Offer::status.
   */
  OfferFsm makeOfferFsm();

  /// at + timeout, saturated at the max height
  Height expiryHeight(Height at, Height timeout);

  /// State precondition error for the event
  ExchangeError stateErrorFor(OfferEvent event);

}  // namespace datex::exchange
