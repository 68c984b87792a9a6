/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/escrow_invoker.hpp"

#include "escrow/escrow_error.hpp"

namespace datex::escrow {

  EscrowInvoker::EscrowInvoker(std::shared_ptr<HandlerRegistry> handlers)
      : handlers_{std::move(handlers)},
        logger_{common::createLogger("escrow")} {}

  EscrowOutcome EscrowInvoker::invoke(const OfferId &offer_id,
                                      const Address &handler,
                                      const EscrowCall &call) const {
    EscrowOutcome settlement;
    auto maybe_handler = handlers_->get(handler);
    if (not maybe_handler) {
      settlement.failure = maybe_handler.error().message();
      logger_->warn("offer {}: {}", offer_id.toHex(), *settlement.failure);
      return settlement;
    }

    try {
      auto result = maybe_handler.value()->attempt(offer_id, call);
      if (result) {
        settlement.receipt = std::move(result.value());
      } else {
        settlement.failure = result.error().message();
      }
    } catch (const std::exception &e) {
      settlement.failure = e.what();
    } catch (...) {
      settlement.failure =
          make_error_code(EscrowError::kUnknownException).message();
    }

    if (settlement.failure) {
      logger_->warn("offer {}: escrow {} failed: {}",
                    offer_id.toHex(),
                    handler.toHex(),
                    *settlement.failure);
    } else {
      logger_->debug("offer {}: escrow {} returned {} bytes",
                     offer_id.toHex(),
                     handler.toHex(),
                     settlement.receipt->size());
    }
    return settlement;
  }

}  // namespace datex::escrow
