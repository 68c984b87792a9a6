/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "exchange/impl/exchange_impl.hpp"

#include <set>

#include "exchange/exchange_error.hpp"
#include "primitives/handle_generator.hpp"

namespace datex::exchange {

  ExchangeImpl::ExchangeImpl(const ExchangeConfig &config,
                             std::shared_ptr<LogicalClock> clock,
                             std::shared_ptr<OfferStore> store,
                             std::shared_ptr<apps::AppRegistry> apps,
                             std::shared_ptr<HandlerRegistry> handlers,
                             std::shared_ptr<events::Events> events)
      : config_{config},
        clock_{std::move(clock)},
        store_{std::move(store)},
        handlers_{handlers},
        events_{std::move(events)},
        auth_{std::move(apps)},
        invoker_{std::move(handlers)},
        fsm_{makeOfferFsm()},
        logger_{common::createLogger("exchange")} {}

  outcome::result<OfferId> ExchangeImpl::prepare(
      const Address &sender,
      const std::string &provider,
      const Address &consumer,
      const Escrow &escrow,
      const std::vector<DataId> &data_ids) {
    OUTCOME_TRY(guard, enter());
    OUTCOME_TRY(auth_.controlsProvider(sender, provider));
    if (not handlers_->contains(escrow.handler)) {
      return ExchangeError::kEscrowNotFound;
    }
    OUTCOME_TRY(checkDataIds({}, data_ids));

    const auto at{clock_->height()};
    Offer offer;
    offer.id = nextOfferId(sender, at);
    offer.provider = provider;
    offer.consumer = consumer;
    offer.data_ids = data_ids;
    offer.escrow = escrow;
    OUTCOME_TRY(store_->insert(offer));

    logger_->info("offer {} prepared by app '{}' for {}",
                  offer.id.toHex(),
                  provider,
                  consumer.toHex());
    events_->signalOfferPrepared({offer.id, sender, at});
    return offer.id;
  }

  outcome::result<void> ExchangeImpl::addDataIds(
      const Address &sender,
      const OfferId &offer_id,
      const std::vector<DataId> &data_ids) {
    OUTCOME_TRY(guard, enter());
    OUTCOME_TRY(offer, store_->get(offer_id));
    OUTCOME_TRY(auth_.controlsProvider(sender, offer.provider));
    OUTCOME_TRY(requireState(offer, OfferEvent::kAddDataIds));
    OUTCOME_TRY(checkDataIds(offer.data_ids, data_ids));

    OfferEventContext context;
    context.by = sender;
    context.at = clock_->height();
    context.data_ids = data_ids;
    return apply(offer, OfferEvent::kAddDataIds, context);
  }

  outcome::result<void> ExchangeImpl::order(const Address &sender,
                                            const OfferId &offer_id) {
    OUTCOME_TRY(guard, enter());
    OUTCOME_TRY(offer, store_->get(offer_id));
    OUTCOME_TRY(auth_.controlsProvider(sender, offer.provider));
    OUTCOME_TRY(requireState(offer, OfferEvent::kOrder));

    OfferEventContext context;
    context.by = sender;
    context.at = clock_->height();
    context.timeout = config_.offer_timeout;
    OUTCOME_TRY(apply(offer, OfferEvent::kOrder, context));

    logger_->info("offer {} presented until {}", offer_id.toHex(), offer.until);
    events_->signalOfferPresented({offer_id, sender, context.at});
    return outcome::success();
  }

  outcome::result<void> ExchangeImpl::cancel(const Address &sender,
                                             const OfferId &offer_id) {
    OUTCOME_TRY(guard, enter());
    OUTCOME_TRY(offer, store_->get(offer_id));
    OUTCOME_TRY(auth_.controlsProvider(sender, offer.provider));
    OUTCOME_TRY(requireState(offer, OfferEvent::kCancel));

    OfferEventContext context;
    context.by = sender;
    context.at = clock_->height();
    OUTCOME_TRY(apply(offer, OfferEvent::kCancel, context));

    events_->signalOfferCanceled({offer_id, sender, context.at});
    return outcome::success();
  }

  outcome::result<Settlement> ExchangeImpl::settle(const Address &sender,
                                                   const OfferId &offer_id) {
    OUTCOME_TRY(guard, enter());
    OUTCOME_TRY(offer, store_->get(offer_id));
    OUTCOME_TRY(auth_.isConsumer(sender, offer));
    OUTCOME_TRY(requireState(offer, OfferEvent::kSettle));
    OUTCOME_TRY(requireNotExpired(offer));

    const auto at{clock_->height()};
    auto settlement = invoker_.invoke(
        offer.id, offer.escrow.handler, {offer.escrow.sign, offer.escrow.args});
    if (not settlement.succeeded()) {
      events_->signalEscrowExecutionFailed(
          {offer_id, sender, *settlement.failure, at});
      return settlement;
    }

    OfferEventContext context;
    context.by = sender;
    context.at = at;
    OUTCOME_TRY(apply(offer, OfferEvent::kSettle, context));

    logger_->info("offer {} settled", offer_id.toHex());
    events_->signalOfferSettled({offer_id, sender, at});
    events_->signalOfferReceipt({offer_id, sender, *settlement.receipt, at});
    return settlement;
  }

  outcome::result<void> ExchangeImpl::reject(const Address &sender,
                                             const OfferId &offer_id) {
    OUTCOME_TRY(guard, enter());
    OUTCOME_TRY(offer, store_->get(offer_id));
    OUTCOME_TRY(auth_.isConsumer(sender, offer));
    OUTCOME_TRY(requireState(offer, OfferEvent::kReject));
    OUTCOME_TRY(requireNotExpired(offer));

    OfferEventContext context;
    context.by = sender;
    context.at = clock_->height();
    OUTCOME_TRY(apply(offer, OfferEvent::kReject, context));

    events_->signalOfferRejected({offer_id, sender, context.at});
    return outcome::success();
  }

  bool ExchangeImpl::offerExists(const OfferId &offer_id) const {
    return store_->contains(offer_id);
  }

  outcome::result<Offer> ExchangeImpl::getOffer(const OfferId &offer_id) const {
    return store_->get(offer_id);
  }

  outcome::result<OfferMembers> ExchangeImpl::getOfferMembers(
      const OfferId &offer_id) const {
    OUTCOME_TRY(offer, store_->get(offer_id));
    OUTCOME_TRY(owner, auth_.providerOwner(offer.provider));
    return OfferMembers{owner, offer.consumer};
  }

  std::vector<Offer> ExchangeImpl::listOffers() const {
    return store_->list();
  }

  outcome::result<ReentrancyGuard> ExchangeImpl::enter() {
    auto guard{ReentrancyGuard::enter(busy_)};
    if (not guard) {
      logger_->warn("reentrant call rejected");
      return ExchangeError::kReentrantCall;
    }
    return std::move(guard.value());
  }

  outcome::result<void> ExchangeImpl::requireState(const Offer &offer,
                                                   OfferEvent event) const {
    if (not fsm_.check(offer.status, event)) {
      return stateErrorFor(event);
    }
    return outcome::success();
  }

  outcome::result<void> ExchangeImpl::requireNotExpired(
      const Offer &offer) const {
    if (config_.enforce_expiry && clock_->height() > offer.until) {
      return ExchangeError::kOutdatedOffer;
    }
    return outcome::success();
  }

  outcome::result<void> ExchangeImpl::checkDataIds(
      const std::vector<DataId> &current,
      const std::vector<DataId> &appended) const {
    if (current.size() + appended.size() > config_.max_data_ids) {
      return ExchangeError::kDataIdsLimitExceeded;
    }
    std::set<DataId> unique(current.begin(), current.end());
    for (const auto &data_id : appended) {
      if (not unique.insert(data_id).second) {
        return ExchangeError::kDuplicateDataId;
      }
    }
    return outcome::success();
  }

  outcome::result<void> ExchangeImpl::apply(Offer &offer,
                                            OfferEvent event,
                                            const OfferEventContext &context) {
    const auto from{offer.status};
    if (not fsm_.dispatch(offer, from, event, context)) {
      return stateErrorFor(event);
    }
    OUTCOME_TRY(store_->update(offer));
    logger_->debug("offer {}: {} -> {} at {}",
                   offer.id.toHex(),
                   toString(from),
                   toString(offer.status),
                   context.at);
    return outcome::success();
  }

  OfferId ExchangeImpl::nextOfferId(const Address &creator,
                                    Height height) const {
    uint64_t nonce{0};
    auto id{primitives::generateHandle(creator, height, nonce)};
    while (store_->contains(id)) {
      id = primitives::generateHandle(creator, height, ++nonce);
    }
    return id;
  }

}  // namespace datex::exchange
