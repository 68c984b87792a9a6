/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/handler_registry.hpp"

#include "escrow/escrow_error.hpp"

namespace datex::escrow {

  HandlerRegistry::HandlerRegistry()
      : logger_{common::createLogger("escrow")} {}

  outcome::result<void> HandlerRegistry::registerHandler(
      const Address &address, std::shared_ptr<SettlementHandler> handler) {
    if (not handlers_.emplace(address, std::move(handler)).second) {
      return EscrowError::kHandlerAlreadyRegistered;
    }
    logger_->debug("handler {} registered", address.toHex());
    return outcome::success();
  }

  outcome::result<void> HandlerRegistry::unregisterHandler(
      const Address &address) {
    if (handlers_.erase(address) == 0) {
      return EscrowError::kHandlerNotFound;
    }
    logger_->debug("handler {} unregistered", address.toHex());
    return outcome::success();
  }

  bool HandlerRegistry::contains(const Address &address) const {
    return handlers_.find(address) != handlers_.end();
  }

  outcome::result<std::shared_ptr<SettlementHandler>> HandlerRegistry::get(
      const Address &address) const {
    auto it = handlers_.find(address);
    if (it == handlers_.end()) {
      return EscrowError::kHandlerNotFound;
    }
    return it->second;
  }

}  // namespace datex::escrow
