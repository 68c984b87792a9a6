/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "exchange/exchange_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(datex::exchange, ExchangeError, e) {
  using E = datex::exchange::ExchangeError;
  switch (e) {
    case E::kOfferNotFound:
      return "ExchangeError: offer does not exist";
    case E::kOfferAlreadyExists:
      return "ExchangeError: offer already exists";
    case E::kAppNotFound:
      return "ExchangeError: offeror app does not exist";
    case E::kUnauthorized:
      return "ExchangeError: should have required authority";
    case E::kNeutralStateOnly:
      return "ExchangeError: neutral state only";
    case E::kPendingStateOnly:
      return "ExchangeError: pending state only";
    case E::kDataIdsLimitExceeded:
      return "ExchangeError: dataIds length exceeded";
    case E::kDuplicateDataId:
      return "ExchangeError: duplicate data id";
    case E::kEscrowNotFound:
      return "ExchangeError: not contract address";
    case E::kOutdatedOffer:
      return "ExchangeError: outdated order";
    case E::kReentrantCall:
      return "ExchangeError: reentrant call";
  }
  return "ExchangeError: unknown error";
}
