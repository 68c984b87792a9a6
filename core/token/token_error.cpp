/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "token/token_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(datex::token, TokenError, e) {
  using E = datex::token::TokenError;
  switch (e) {
    case E::kInsufficientBalance:
      return "TokenError: transfer amount exceeds balance";
    case E::kInsufficientAllowance:
      return "TokenError: transfer amount exceeds allowance";
    case E::kBalanceOverflow:
      return "TokenError: balance overflow";
    case E::kUnknownSelector:
      return "TokenError: unknown method selector";
    case E::kMalformedArgs:
      return "TokenError: malformed escrow arguments";
    case E::kExchangeUnavailable:
      return "TokenError: exchange is not available";
  }
  return "TokenError: unknown error";
}
