/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/outcome.hpp"
#include "exchange/offer.hpp"

namespace datex::exchange {

  /**
   * Holder of all offer records. Records are never removed, callers get
   * copies.
   */
  class OfferStore {
   public:
    virtual ~OfferStore() = default;

    virtual bool contains(const OfferId &id) const = 0;

    /**
     * Get offer by id
     * @return copy of the record or ExchangeError::kOfferNotFound
     */
    virtual outcome::result<Offer> get(const OfferId &id) const = 0;

    /**
     * Stores new record
     * @return ExchangeError::kOfferAlreadyExists if id is taken
     */
    virtual outcome::result<void> insert(Offer offer) = 0;

    /**
     * Replaces existing record with the same id
     * @return ExchangeError::kOfferNotFound if there is no such record
     */
    virtual outcome::result<void> update(const Offer &offer) = 0;

    /// All records ordered by id
    virtual std::vector<Offer> list() const = 0;
  };

}  // namespace datex::exchange
