/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "escrow/escrow_invoker.hpp"
#include "exchange/offer_reader.hpp"

namespace datex::exchange {

  /**
   * Outcome of settle: receipt returned by the escrow handler, or the reason
   * it failed. A failed settlement leaves the offer pending.
   */
  using Settlement = escrow::EscrowOutcome;

  /**
   * Orderbook of data offers. Mutating operations take the caller identity
   * and either apply completely or fail without any effect.
   */
  class Exchange : public OfferReader {
   public:
    /**
     * Creates neutral offer
     * @param sender - owner of the provider app
     * @param provider - name of the offering app
     * @param consumer - counterparty expected to settle or reject
     * @param escrow - settlement handler invocation, handler must be
     * registered
     * @param data_ids - initial bundle
     * @return id of the new offer
     */
    virtual outcome::result<OfferId> prepare(
        const Address &sender,
        const std::string &provider,
        const Address &consumer,
        const Escrow &escrow,
        const std::vector<DataId> &data_ids) = 0;

    /// Appends data ids to neutral offer, provider only
    virtual outcome::result<void> addDataIds(
        const Address &sender,
        const OfferId &offer_id,
        const std::vector<DataId> &data_ids) = 0;

    /// Presents neutral offer to the consumer and starts expiry countdown
    virtual outcome::result<void> order(const Address &sender,
                                        const OfferId &offer_id) = 0;

    /// Withdraws pending offer, provider only
    virtual outcome::result<void> cancel(const Address &sender,
                                         const OfferId &offer_id) = 0;

    /**
     * Invokes escrow of pending offer, consumer only.
     * Escrow failure is reported in Settlement, the offer stays pending and
     * can be settled again.
     */
    virtual outcome::result<Settlement> settle(const Address &sender,
                                               const OfferId &offer_id) = 0;

    /// Declines pending offer, consumer only
    virtual outcome::result<void> reject(const Address &sender,
                                         const OfferId &offer_id) = 0;

    virtual std::vector<Offer> listOffers() const = 0;
  };

}  // namespace datex::exchange
