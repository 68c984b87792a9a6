/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "token/token_escrow.hpp"

#include "common/endian.hpp"
#include "token/token_error.hpp"

namespace datex::token {
  namespace {
    constexpr size_t kArgsLength = Address::size() + sizeof(TokenAmount);

    const escrow::Selector &transactSelector() {
      static const auto selector{escrow::makeSelector(kTransactSignature)};
      return selector;
    }
  }  // namespace

  TokenEscrow::TokenEscrow(const Address &address,
                           std::shared_ptr<TokenLedger> ledger,
                           std::weak_ptr<exchange::OfferReader> offers)
      : address_{address},
        ledger_{std::move(ledger)},
        offers_{std::move(offers)},
        logger_{common::createLogger("token")} {}

  outcome::result<Bytes> TokenEscrow::attempt(const OfferId &offer_id,
                                              const EscrowCall &call) {
    if (call.selector != transactSelector()) {
      return TokenError::kUnknownSelector;
    }
    if (call.args.size() != kArgsLength) {
      return TokenError::kMalformedArgs;
    }
    OUTCOME_TRY(token,
                Address::fromSpan(BytesIn{call.args}.first(Address::size())));
    auto amount{common::readUint64BigEndian(call.args, Address::size())};
    if (not amount) {
      return TokenError::kMalformedArgs;
    }

    auto offers{offers_.lock()};
    if (not offers) {
      return TokenError::kExchangeUnavailable;
    }
    OUTCOME_TRY(members, offers->getOfferMembers(offer_id));
    OUTCOME_TRY(ledger_->transferFrom(
        token, address_, members.consumer, members.provider, *amount));

    logger_->info("offer {} paid {} of {}", offer_id.toHex(), *amount,
                  token.toHex());
    Bytes receipt;
    append(receipt, offer_id);
    append(receipt, token);
    common::putUint64BigEndian(receipt, *amount);
    return receipt;
  }

  const Address &TokenEscrow::address() const {
    return address_;
  }

  EscrowCall TokenEscrow::makeCall(const Address &token, TokenAmount amount) {
    EscrowCall call{transactSelector(), {}};
    append(call.args, token);
    common::putUint64BigEndian(call.args, amount);
    return call;
  }

}  // namespace datex::token
