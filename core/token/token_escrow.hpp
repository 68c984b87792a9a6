/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "escrow/settlement_handler.hpp"
#include "exchange/offer_reader.hpp"
#include "token/token_ledger.hpp"

namespace datex::token {
  using escrow::EscrowCall;
  using primitives::OfferId;

  /// transact(address token, uint256 amount, bytes8 offer_id)
  constexpr auto kTransactSignature = "transact(address,uint256,bytes8)";

  /**
   * Settlement handler paying the provider in tokens.
   * Moves amount of token from the consumer to the owner of the provider app,
   * the consumer must approve the escrow address as spender beforehand.
   * Arguments are token address (20 bytes) followed by big-endian amount
   * (8 bytes), receipt is offer_id || token || amount.
   */
  class TokenEscrow : public escrow::SettlementHandler {
   public:
    TokenEscrow(const Address &address,
                std::shared_ptr<TokenLedger> ledger,
                std::weak_ptr<exchange::OfferReader> offers);

    outcome::result<Bytes> attempt(const OfferId &offer_id,
                                   const EscrowCall &call) override;

    /// Address the handler acts as when spending allowances
    const Address &address() const;

    /// Call to store in an offer paying amount of token
    static EscrowCall makeCall(const Address &token, TokenAmount amount);

   private:
    Address address_;
    std::shared_ptr<TokenLedger> ledger_;
    std::weak_ptr<exchange::OfferReader> offers_;
    common::Logger logger_;
  };

}  // namespace datex::token
