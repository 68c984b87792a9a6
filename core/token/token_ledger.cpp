/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "token/token_ledger.hpp"

#include <limits>

#include "token/token_error.hpp"

namespace datex::token {

  TokenLedger::TokenLedger() : logger_{common::createLogger("token")} {}

  outcome::result<void> TokenLedger::mint(const Address &token,
                                          const Address &to,
                                          TokenAmount amount) {
    auto &balance = balances_[{token, to}];
    if (balance > std::numeric_limits<TokenAmount>::max() - amount) {
      return TokenError::kBalanceOverflow;
    }
    balance += amount;
    logger_->debug("mint {} of {} to {}", amount, token.toHex(), to.toHex());
    return outcome::success();
  }

  TokenAmount TokenLedger::balanceOf(const Address &token,
                                     const Address &holder) const {
    auto it = balances_.find({token, holder});
    return it == balances_.end() ? 0 : it->second;
  }

  void TokenLedger::approve(const Address &token,
                            const Address &owner,
                            const Address &spender,
                            TokenAmount amount) {
    allowances_[{token, owner, spender}] = amount;
  }

  TokenAmount TokenLedger::allowance(const Address &token,
                                     const Address &owner,
                                     const Address &spender) const {
    auto it = allowances_.find({token, owner, spender});
    return it == allowances_.end() ? 0 : it->second;
  }

  outcome::result<void> TokenLedger::transfer(const Address &token,
                                              const Address &from,
                                              const Address &to,
                                              TokenAmount amount) {
    if (balanceOf(token, from) < amount) {
      return TokenError::kInsufficientBalance;
    }
    if (from != to
        && balanceOf(token, to)
               > std::numeric_limits<TokenAmount>::max() - amount) {
      return TokenError::kBalanceOverflow;
    }
    balances_[{token, from}] -= amount;
    balances_[{token, to}] += amount;
    logger_->debug("transfer {} of {} from {} to {}",
                   amount,
                   token.toHex(),
                   from.toHex(),
                   to.toHex());
    return outcome::success();
  }

  outcome::result<void> TokenLedger::transferFrom(const Address &token,
                                                  const Address &spender,
                                                  const Address &from,
                                                  const Address &to,
                                                  TokenAmount amount) {
    const auto allowed{allowance(token, from, spender)};
    if (allowed < amount) {
      return TokenError::kInsufficientAllowance;
    }
    OUTCOME_TRY(transfer(token, from, to, amount));
    allowances_[{token, from, spender}] = allowed - amount;
    return outcome::success();
  }

}  // namespace datex::token
