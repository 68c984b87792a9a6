/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/logical_clock.hpp"
#include "common/logger.hpp"
#include "escrow/reentrancy_guard.hpp"
#include "exchange/authorization.hpp"
#include "exchange/exchange.hpp"
#include "exchange/exchange_config.hpp"
#include "exchange/exchange_events.hpp"
#include "exchange/offer_fsm.hpp"
#include "exchange/offer_store.hpp"

namespace datex::exchange {
  using clock::LogicalClock;
  using escrow::HandlerRegistry;
  using escrow::ReentrancyGuard;

  class ExchangeImpl : public Exchange {
   public:
    ExchangeImpl(const ExchangeConfig &config,
                 std::shared_ptr<LogicalClock> clock,
                 std::shared_ptr<OfferStore> store,
                 std::shared_ptr<apps::AppRegistry> apps,
                 std::shared_ptr<HandlerRegistry> handlers,
                 std::shared_ptr<events::Events> events);

    outcome::result<OfferId> prepare(
        const Address &sender,
        const std::string &provider,
        const Address &consumer,
        const Escrow &escrow,
        const std::vector<DataId> &data_ids) override;

    outcome::result<void> addDataIds(
        const Address &sender,
        const OfferId &offer_id,
        const std::vector<DataId> &data_ids) override;

    outcome::result<void> order(const Address &sender,
                                const OfferId &offer_id) override;

    outcome::result<void> cancel(const Address &sender,
                                 const OfferId &offer_id) override;

    outcome::result<Settlement> settle(const Address &sender,
                                       const OfferId &offer_id) override;

    outcome::result<void> reject(const Address &sender,
                                 const OfferId &offer_id) override;

    bool offerExists(const OfferId &offer_id) const override;

    outcome::result<Offer> getOffer(const OfferId &offer_id) const override;

    outcome::result<OfferMembers> getOfferMembers(
        const OfferId &offer_id) const override;

    std::vector<Offer> listOffers() const override;

   private:
    /// Marks the orderbook busy until the guard is destroyed
    outcome::result<ReentrancyGuard> enter();

    /// Fails with state error if event is not allowed in current state
    outcome::result<void> requireState(const Offer &offer,
                                       OfferEvent event) const;

    outcome::result<void> requireNotExpired(const Offer &offer) const;

    /// Bundle stays a set within the size limit after appending
    outcome::result<void> checkDataIds(
        const std::vector<DataId> &current,
        const std::vector<DataId> &appended) const;

    /// Applies event to the offer and stores it
    outcome::result<void> apply(Offer &offer,
                                OfferEvent event,
                                const OfferEventContext &context);

    OfferId nextOfferId(const Address &creator, Height height) const;

    ExchangeConfig config_;
    std::shared_ptr<LogicalClock> clock_;
    std::shared_ptr<OfferStore> store_;
    std::shared_ptr<HandlerRegistry> handlers_;
    std::shared_ptr<events::Events> events_;
    AuthorizationGate auth_;
    escrow::EscrowInvoker invoker_;
    OfferFsm fsm_;
    escrow::ReentrancyFlag busy_;
    common::Logger logger_;
  };

}  // namespace datex::exchange
