/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "exchange/impl/in_memory_offer_store.hpp"

#include "exchange/exchange_error.hpp"

namespace datex::exchange {

  bool InMemoryOfferStore::contains(const OfferId &id) const {
    return offers_.find(id) != offers_.end();
  }

  outcome::result<Offer> InMemoryOfferStore::get(const OfferId &id) const {
    auto it = offers_.find(id);
    if (it == offers_.end()) {
      return ExchangeError::kOfferNotFound;
    }
    return it->second;
  }

  outcome::result<void> InMemoryOfferStore::insert(Offer offer) {
    auto id = offer.id;
    if (not offers_.emplace(id, std::move(offer)).second) {
      return ExchangeError::kOfferAlreadyExists;
    }
    return outcome::success();
  }

  outcome::result<void> InMemoryOfferStore::update(const Offer &offer) {
    auto it = offers_.find(offer.id);
    if (it == offers_.end()) {
      return ExchangeError::kOfferNotFound;
    }
    it->second = offer;
    return outcome::success();
  }

  std::vector<Offer> InMemoryOfferStore::list() const {
    std::vector<Offer> offers;
    offers.reserve(offers_.size());
    for (const auto &it : offers_) {
      offers.push_back(it.second);
    }
    return offers;
  }

}  // namespace datex::exchange
