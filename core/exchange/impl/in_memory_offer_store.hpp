/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "exchange/offer_store.hpp"

namespace datex::exchange {

  class InMemoryOfferStore : public OfferStore {
   public:
    bool contains(const OfferId &id) const override;

    outcome::result<Offer> get(const OfferId &id) const override;

    outcome::result<void> insert(Offer offer) override;

    outcome::result<void> update(const Offer &offer) override;

    std::vector<Offer> list() const override;

   private:
    std::map<OfferId, Offer> offers_;
  };

}  // namespace datex::exchange
