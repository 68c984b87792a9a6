/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace datex::exchange {

  /**
   * @brief Fatal errors of the orderbook, an operation failed with one of
   * them has no effect
   */
  enum class ExchangeError {
    kOfferNotFound = 1,
    kOfferAlreadyExists,
    kAppNotFound,
    kUnauthorized,
    kNeutralStateOnly,
    kPendingStateOnly,
    kDataIdsLimitExceeded,
    kDuplicateDataId,
    kEscrowNotFound,
    kOutdatedOffer,
    kReentrantCall,
  };

}  // namespace datex::exchange

OUTCOME_HPP_DECLARE_ERROR(datex::exchange, ExchangeError);
