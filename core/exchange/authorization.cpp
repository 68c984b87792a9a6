/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "exchange/authorization.hpp"

#include "exchange/exchange_error.hpp"

namespace datex::exchange {

  AuthorizationGate::AuthorizationGate(std::shared_ptr<apps::AppRegistry> apps)
      : apps_{std::move(apps)} {}

  outcome::result<void> AuthorizationGate::controlsProvider(
      const Address &sender, const std::string &provider) const {
    if (not apps_->exists(provider)) {
      return ExchangeError::kAppNotFound;
    }
    if (not apps_->isOwner(provider, sender)) {
      return ExchangeError::kUnauthorized;
    }
    return outcome::success();
  }

  outcome::result<void> AuthorizationGate::isConsumer(
      const Address &sender, const Offer &offer) const {
    if (sender != offer.consumer) {
      return ExchangeError::kUnauthorized;
    }
    return outcome::success();
  }

  outcome::result<Address> AuthorizationGate::providerOwner(
      const std::string &provider) const {
    auto app = apps_->get(provider);
    if (not app) {
      return ExchangeError::kAppNotFound;
    }
    return app.value().owner;
  }

}  // namespace datex::exchange
