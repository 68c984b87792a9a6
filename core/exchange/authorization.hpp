/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "apps/app_registry.hpp"
#include "exchange/offer.hpp"

namespace datex::exchange {

  /**
   * Binds caller identity to the provider or consumer role of an offer
   */
  class AuthorizationGate {
   public:
    explicit AuthorizationGate(std::shared_ptr<apps::AppRegistry> apps);

    /**
     * Checks sender owns the provider app
     * @return ExchangeError::kAppNotFound or ExchangeError::kUnauthorized
     */
    outcome::result<void> controlsProvider(const Address &sender,
                                           const std::string &provider) const;

    /// @return ExchangeError::kUnauthorized unless sender is the consumer
    outcome::result<void> isConsumer(const Address &sender,
                                     const Offer &offer) const;

    /// Current owner of the provider app
    outcome::result<Address> providerOwner(const std::string &provider) const;

   private:
    std::shared_ptr<apps::AppRegistry> apps_;
  };

}  // namespace datex::exchange
