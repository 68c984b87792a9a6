/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "escrow/escrow_call.hpp"

namespace datex::escrow {

  /**
   * External settlement logic invoked once per settlement attempt
   */
  class SettlementHandler {
   public:
    virtual ~SettlementHandler() = default;

    /**
     * Executes settlement of an offer
     * @param offer_id - offer being settled, for correlation
     * @param call - selector and arguments stored in the offer
     * @return receipt payload on success, error describing the failure
     * otherwise
     */
    virtual outcome::result<Bytes> attempt(const OfferId &offer_id,
                                           const EscrowCall &call) = 0;
  };

}  // namespace datex::escrow
