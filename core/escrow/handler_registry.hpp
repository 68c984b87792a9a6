/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "common/logger.hpp"
#include "escrow/settlement_handler.hpp"

namespace datex::escrow {

  /**
   * Binds handler addresses to settlement handlers. An address is a
   * "contract address" only while a handler is registered for it.
   */
  class HandlerRegistry {
   public:
    HandlerRegistry();

    outcome::result<void> registerHandler(
        const Address &address, std::shared_ptr<SettlementHandler> handler);

    outcome::result<void> unregisterHandler(const Address &address);

    bool contains(const Address &address) const;

    outcome::result<std::shared_ptr<SettlementHandler>> get(
        const Address &address) const;

   private:
    std::map<Address, std::shared_ptr<SettlementHandler>> handlers_;
    common::Logger logger_;
  };

}  // namespace datex::escrow
