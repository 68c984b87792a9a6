/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "exchange/offer_fsm.hpp"

#include <gtest/gtest.h>
#include <limits>

#include "testutil/outcome.hpp"

namespace datex::exchange {

  class OfferFsmTest : public ::testing::Test {
   public:
    OfferFsm fsm{makeOfferFsm()};
    Offer offer;
  };

  /**
   * @given neutral offer
   * @when order is dispatched
   * @then offer is pending with at and until set from the context
   */
  TEST_F(OfferFsmTest, Order) {
    OfferEventContext context;
    context.at = 10;
    context.timeout = 600;
    EXPECT_OUTCOME_EQ(
        fsm.dispatch(offer, offer.status, OfferEvent::kOrder, context),
        OfferStatus::kPending);
    EXPECT_EQ(offer.status, OfferStatus::kPending);
    EXPECT_EQ(offer.at, 10);
    EXPECT_EQ(offer.until, 610);
  }

  /**
   * @given order at a height close to the max height
   * @when timeout would step past the max height
   * @then expiry is clamped to the max height
   */
  TEST_F(OfferFsmTest, OrderNearMaxHeight) {
    constexpr auto kMax{std::numeric_limits<Height>::max()};
    OfferEventContext context;
    context.at = kMax - 10;
    context.timeout = 600;
    EXPECT_OUTCOME_EQ(
        fsm.dispatch(offer, offer.status, OfferEvent::kOrder, context),
        OfferStatus::kPending);
    EXPECT_EQ(offer.at, kMax - 10);
    EXPECT_EQ(offer.until, kMax);

    EXPECT_EQ(expiryHeight(1, kMax), kMax);
    EXPECT_EQ(expiryHeight(kMax, 1), kMax);
    EXPECT_EQ(expiryHeight(kMax - 600, 600), kMax);
    EXPECT_EQ(expiryHeight(0, kMax), kMax);
    EXPECT_EQ(expiryHeight(5, 7), 12);
  }

  /**
   * @given neutral offer
   * @when data ids are added
   * @then offer stays neutral with data ids appended
   */
  TEST_F(OfferFsmTest, AddDataIds) {
    OfferEventContext context;
    context.data_ids.resize(2);
    context.data_ids[1][0] = 1;
    EXPECT_OUTCOME_EQ(
        fsm.dispatch(offer, offer.status, OfferEvent::kAddDataIds, context),
        OfferStatus::kNeutral);
    EXPECT_EQ(offer.data_ids, context.data_ids);
  }

  /**
   * @given every offer state
   * @when each event is checked
   * @then only the lifecycle transitions are allowed
   */
  TEST_F(OfferFsmTest, TransitionTable) {
    using S = OfferStatus;
    using E = OfferEvent;
    const std::vector<std::tuple<S, E, boost::optional<S>>> table{
        {S::kNeutral, E::kAddDataIds, S::kNeutral},
        {S::kNeutral, E::kOrder, S::kPending},
        {S::kNeutral, E::kCancel, boost::none},
        {S::kNeutral, E::kSettle, boost::none},
        {S::kNeutral, E::kReject, boost::none},
        {S::kPending, E::kAddDataIds, boost::none},
        {S::kPending, E::kOrder, boost::none},
        {S::kPending, E::kCancel, S::kCanceled},
        {S::kPending, E::kSettle, S::kSettled},
        {S::kPending, E::kReject, S::kRejected},
    };
    for (const auto &[from, event, to] : table) {
      auto result{fsm.check(from, event)};
      if (to) {
        EXPECT_OUTCOME_EQ(result, *to);
      } else {
        EXPECT_FALSE(result);
      }
    }
    for (auto state : {S::kSettled, S::kCanceled, S::kRejected}) {
      EXPECT_TRUE(fsm.isFinal(state));
      for (auto event :
           {E::kAddDataIds, E::kOrder, E::kCancel, E::kSettle, E::kReject}) {
        EXPECT_FALSE(fsm.check(state, event));
      }
    }
    EXPECT_FALSE(fsm.isFinal(S::kNeutral));
    EXPECT_FALSE(fsm.isFinal(S::kPending));
  }

  /**
   * @given events
   * @when state error is requested
   * @then neutral events report neutral state only, others pending state only
   */
  TEST_F(OfferFsmTest, StateErrors) {
    EXPECT_EQ(stateErrorFor(OfferEvent::kAddDataIds),
              ExchangeError::kNeutralStateOnly);
    EXPECT_EQ(stateErrorFor(OfferEvent::kOrder),
              ExchangeError::kNeutralStateOnly);
    EXPECT_EQ(stateErrorFor(OfferEvent::kCancel),
              ExchangeError::kPendingStateOnly);
    EXPECT_EQ(stateErrorFor(OfferEvent::kSettle),
              ExchangeError::kPendingStateOnly);
    EXPECT_EQ(stateErrorFor(OfferEvent::kReject),
              ExchangeError::kPendingStateOnly);
  }

}  // namespace datex::exchange
