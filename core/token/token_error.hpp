/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace datex::token {

  enum class TokenError {
    kInsufficientBalance = 1,
    kInsufficientAllowance,
    kBalanceOverflow,
    kUnknownSelector,
    kMalformedArgs,
    kExchangeUnavailable,
  };

}  // namespace datex::token

OUTCOME_HPP_DECLARE_ERROR(datex::token, TokenError);
