/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "exchange/offer_fsm.hpp"

#include <limits>

namespace datex::exchange {
  using TransitionRule = OfferFsm::TransitionRule;

  Height expiryHeight(Height at, Height timeout) {
    constexpr auto kMaxHeight{std::numeric_limits<Height>::max()};
    if (at > 0 && timeout > kMaxHeight - at) {
      return kMaxHeight;
    }
    return at + timeout;
  }

  OfferFsm makeOfferFsm() {
    OfferFsm fsm{{
        TransitionRule(OfferEvent::kAddDataIds)
            .from(OfferStatus::kNeutral)
            .to(OfferStatus::kNeutral)
            .action([](auto &offer, auto, const auto &context, auto, auto) {
              offer.data_ids.insert(offer.data_ids.end(),
                                    context.data_ids.begin(),
                                    context.data_ids.end());
            }),
        TransitionRule(OfferEvent::kOrder)
            .from(OfferStatus::kNeutral)
            .to(OfferStatus::kPending)
            .action([](auto &offer, auto, const auto &context, auto, auto) {
              offer.at = context.at;
              offer.until = expiryHeight(context.at, context.timeout);
            }),
        TransitionRule(OfferEvent::kCancel)
            .from(OfferStatus::kPending)
            .to(OfferStatus::kCanceled),
        TransitionRule(OfferEvent::kSettle)
            .from(OfferStatus::kPending)
            .to(OfferStatus::kSettled),
        TransitionRule(OfferEvent::kReject)
            .from(OfferStatus::kPending)
            .to(OfferStatus::kRejected),
    }};
    fsm.setAnyChangeAction(
        [](auto &offer, auto, const auto &, auto, auto to) {
          offer.status = to;
        });
    return fsm;
  }

  ExchangeError stateErrorFor(OfferEvent event) {
    switch (event) {
      case OfferEvent::kAddDataIds:
      case OfferEvent::kOrder:
        return ExchangeError::kNeutralStateOnly;
      case OfferEvent::kCancel:
      case OfferEvent::kSettle:
      case OfferEvent::kReject:
        return ExchangeError::kPendingStateOnly;
    }
    return ExchangeError::kPendingStateOnly;
  }
}  // namespace datex::exchange
