/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <tuple>

#include "common/logger.hpp"
#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace datex::token {
  using primitives::Address;
  using TokenAmount = uint64_t;

  /**
   * Balances and allowances of fungible tokens, a token is identified by
   * its address
   */
  class TokenLedger {
   public:
    TokenLedger();

    /// Creates amount of token out of thin air
    outcome::result<void> mint(const Address &token,
                               const Address &to,
                               TokenAmount amount);

    TokenAmount balanceOf(const Address &token, const Address &holder) const;

    /// Allows spender to transfer up to amount from owner, replaces previous
    /// allowance
    void approve(const Address &token,
                 const Address &owner,
                 const Address &spender,
                 TokenAmount amount);

    TokenAmount allowance(const Address &token,
                          const Address &owner,
                          const Address &spender) const;

    outcome::result<void> transfer(const Address &token,
                                   const Address &from,
                                   const Address &to,
                                   TokenAmount amount);

    /// Transfer on behalf of from, consumes allowance given to spender
    outcome::result<void> transferFrom(const Address &token,
                                       const Address &spender,
                                       const Address &from,
                                       const Address &to,
                                       TokenAmount amount);

   private:
    using BalanceKey = std::tuple<Address, Address>;
    using AllowanceKey = std::tuple<Address, Address, Address>;

    std::map<BalanceKey, TokenAmount> balances_;
    std::map<AllowanceKey, TokenAmount> allowances_;
    common::Logger logger_;
  };

}  // namespace datex::token
