/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <boost/optional.hpp>

#include "escrow/handler_registry.hpp"

namespace datex::escrow {

  /// Result of one settlement attempt, exactly one field is set
  struct EscrowOutcome {
    boost::optional<Bytes> receipt;
    boost::optional<std::string> failure;

    bool succeeded() const {
      return receipt.has_value();
    }
  };

  /**
   * Performs a single call into the settlement handler and folds any handler
   * failure into EscrowOutcome
   */
  class EscrowInvoker {
   public:
    explicit EscrowInvoker(std::shared_ptr<HandlerRegistry> handlers);

    EscrowOutcome invoke(const OfferId &offer_id,
                         const Address &handler,
                         const EscrowCall &call) const;

   private:
    std::shared_ptr<HandlerRegistry> handlers_;
    common::Logger logger_;
  };

}  // namespace datex::escrow
