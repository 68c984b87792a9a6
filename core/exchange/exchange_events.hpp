/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <exception>
#include <functional>
#include <string>

#include <boost/signals2.hpp>

#include "common/logger.hpp"
#include "exchange/offer.hpp"

namespace datex::exchange::events {
  using Connection = boost::signals2::connection;

  inline common::Logger &eventsLogger() {
    static auto logger{common::createLogger("events")};
    return logger;
  }

  /**
   * Signal combiner calling every subscriber. Exception of a subscriber is
   * logged, the remaining subscribers are still called.
   */
  struct IsolatedSlots {
    using result_type = void;

    template <typename InputIterator>
    void operator()(InputIterator first, InputIterator last) const {
      for (; first != last; ++first) {
        try {
          *first;
        } catch (const std::exception &e) {
          eventsLogger()->error("event subscriber failed: {}", e.what());
        } catch (...) {
          eventsLogger()->error("event subscriber failed: unknown exception");
        }
      }
    }
  };

  struct OfferPrepared {
    OfferId offer_id;
    Address by;
    Height at;
  };

  struct OfferPresented {
    OfferId offer_id;
    Address by;
    Height at;
  };

  struct OfferCanceled {
    OfferId offer_id;
    Address by;
    Height at;
  };

  struct OfferSettled {
    OfferId offer_id;
    Address by;
    Height at;
  };

  struct OfferReceipt {
    OfferId offer_id;
    Address by;
    Bytes receipt;
    Height at;
  };

  struct EscrowExecutionFailed {
    OfferId offer_id;
    Address by;
    std::string reason;
    Height at;
  };

  struct OfferRejected {
    OfferId offer_id;
    Address by;
    Height at;
  };

  /**
   * Append-only lifecycle events of the orderbook. Subscribers are called
   * synchronously in the order of emission and never fail the operation.
   */
  struct Events {
#define DEFINE_EVENT(STRUCT)                                         \
  using STRUCT##Callback = void(const STRUCT &);                     \
  Connection subscribe##STRUCT(std::function<STRUCT##Callback> cb) { \
    return STRUCT##_signal_.connect(cb);                             \
  }                                                                  \
  void signal##STRUCT(const STRUCT &event) {                         \
    STRUCT##_signal_(event);                                         \
  }                                                                  \
  boost::signals2::signal<STRUCT##Callback, IsolatedSlots> STRUCT##_signal_

    DEFINE_EVENT(OfferPrepared);
    DEFINE_EVENT(OfferPresented);
    DEFINE_EVENT(OfferCanceled);
    DEFINE_EVENT(OfferSettled);
    DEFINE_EVENT(OfferReceipt);
    DEFINE_EVENT(EscrowExecutionFailed);
    DEFINE_EVENT(OfferRejected);

#undef DEFINE_EVENT
  };

}  // namespace datex::exchange::events
