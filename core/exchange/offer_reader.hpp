/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "exchange/offer.hpp"

namespace datex::exchange {

  /**
   * Read-only view of the orderbook, available to settlement handlers while
   * the orderbook is busy
   */
  class OfferReader {
   public:
    virtual ~OfferReader() = default;

    virtual bool offerExists(const OfferId &offer_id) const = 0;

    virtual outcome::result<Offer> getOffer(const OfferId &offer_id) const = 0;

    /**
     * Identities of both sides
     * @return owner of the provider app and the consumer
     */
    virtual outcome::result<OfferMembers> getOfferMembers(
        const OfferId &offer_id) const = 0;
  };

}  // namespace datex::exchange
