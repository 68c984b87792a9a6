/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "accounts/account_registry.hpp"
#include "clock/logical_clock.hpp"
#include "common/logger.hpp"
#include "crypto/secp256k1/secp256k1_provider.hpp"

namespace datex::accounts {
  using crypto::secp256k1::Secp256k1Provider;

  class AccountRegistryImpl : public AccountRegistry {
   public:
    AccountRegistryImpl(std::shared_ptr<clock::LogicalClock> clock,
                        std::shared_ptr<Secp256k1Provider> secp256k1);

    outcome::result<AccountId> create(const Address &sender) override;

    outcome::result<AccountId> createTemporary(
        const Address &sender, const Hash256 &identity_hash) override;

    outcome::result<void> unlockTemporary(
        const Address &sender,
        BytesIn identity_preimage,
        const Address &new_owner,
        const Signature &password_signature) override;

    outcome::result<AccountId> getAccountIdFromSignature(
        const MessageHash &message_hash,
        const Signature &signature) const override;

    outcome::result<Account> getAccount(const AccountId &id) const override;

    outcome::result<AccountId> getAccountId(
        const Address &owner) const override;

   private:
    AccountId nextId(const Address &creator) const;

    std::shared_ptr<clock::LogicalClock> clock_;
    std::shared_ptr<Secp256k1Provider> secp256k1_;
    std::map<AccountId, Account> accounts_;
    std::map<Address, AccountId> by_owner_;
    std::map<Hash256, AccountId> by_identity_;
    std::map<Address, AccountId> by_proof_;
    common::Logger logger_;
  };

}  // namespace datex::accounts
