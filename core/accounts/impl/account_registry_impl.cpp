/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "accounts/impl/account_registry_impl.hpp"

#include "accounts/account_registry_error.hpp"
#include "crypto/blake2/blake2b.hpp"
#include "primitives/address.hpp"
#include "primitives/handle_generator.hpp"

namespace datex::accounts {
  using crypto::blake2b::blake2b_256;

  AccountRegistryImpl::AccountRegistryImpl(
      std::shared_ptr<clock::LogicalClock> clock,
      std::shared_ptr<Secp256k1Provider> secp256k1)
      : clock_{std::move(clock)},
        secp256k1_{std::move(secp256k1)},
        logger_{common::createLogger("accounts")} {}

  outcome::result<AccountId> AccountRegistryImpl::create(
      const Address &sender) {
    if (by_owner_.find(sender) != by_owner_.end()) {
      return AccountRegistryError::kAccountAlreadyExists;
    }
    Account account;
    account.id = nextId(sender);
    account.owner = sender;
    account.status = AccountStatus::kCreated;
    by_owner_.emplace(sender, account.id);
    accounts_.emplace(account.id, account);
    logger_->info("account {} created for {}", account.id.toHex(),
                  sender.toHex());
    return account.id;
  }

  outcome::result<AccountId> AccountRegistryImpl::createTemporary(
      const Address &sender, const Hash256 &identity_hash) {
    if (by_identity_.find(identity_hash) != by_identity_.end()) {
      return AccountRegistryError::kIdentityAlreadyRegistered;
    }
    Account account;
    account.id = nextId(sender);
    account.status = AccountStatus::kTemporary;
    account.controller = sender;
    account.identity_hash = identity_hash;
    by_identity_.emplace(identity_hash, account.id);
    accounts_.emplace(account.id, account);
    logger_->info("temporary account {} created by {}", account.id.toHex(),
                  sender.toHex());
    return account.id;
  }

  outcome::result<void> AccountRegistryImpl::unlockTemporary(
      const Address &sender,
      BytesIn identity_preimage,
      const Address &new_owner,
      const Signature &password_signature) {
    auto identity_it = by_identity_.find(blake2b_256(identity_preimage));
    if (identity_it == by_identity_.end()) {
      return AccountRegistryError::kAccountNotFound;
    }
    auto &account = accounts_.at(identity_it->second);
    if (account.status != AccountStatus::kTemporary) {
      return AccountRegistryError::kNotTemporary;
    }
    if (account.controller != sender) {
      return AccountRegistryError::kNotController;
    }
    if (by_owner_.find(new_owner) != by_owner_.end()) {
      return AccountRegistryError::kAccountAlreadyExists;
    }

    const auto password_hash{blake2b_256({identity_preimage, new_owner})};
    OUTCOME_TRY(signer,
                secp256k1_->recoverPublicKey(password_hash, password_signature));
    const auto proof{primitives::makeAddress(signer)};

    account.owner = new_owner;
    account.status = AccountStatus::kCreated;
    account.password_proof = proof;
    by_owner_.emplace(new_owner, account.id);
    by_proof_[proof] = account.id;
    logger_->info("account {} unlocked for {}", account.id.toHex(),
                  new_owner.toHex());
    return outcome::success();
  }

  outcome::result<AccountId> AccountRegistryImpl::getAccountIdFromSignature(
      const MessageHash &message_hash, const Signature &signature) const {
    OUTCOME_TRY(signer, secp256k1_->recoverPublicKey(message_hash, signature));
    auto it = by_proof_.find(primitives::makeAddress(signer));
    if (it == by_proof_.end()) {
      return AccountRegistryError::kAccountNotFound;
    }
    return it->second;
  }

  outcome::result<Account> AccountRegistryImpl::getAccount(
      const AccountId &id) const {
    auto it = accounts_.find(id);
    if (it == accounts_.end()) {
      return AccountRegistryError::kAccountNotFound;
    }
    return it->second;
  }

  outcome::result<AccountId> AccountRegistryImpl::getAccountId(
      const Address &owner) const {
    auto it = by_owner_.find(owner);
    if (it == by_owner_.end()) {
      return AccountRegistryError::kAccountNotFound;
    }
    return it->second;
  }

  AccountId AccountRegistryImpl::nextId(const Address &creator) const {
    const auto height{clock_->height()};
    uint64_t nonce{0};
    auto id{primitives::generateHandle(creator, height, nonce)};
    while (accounts_.find(id) != accounts_.end()) {
      id = primitives::generateHandle(creator, height, ++nonce);
    }
    return id;
  }

}  // namespace datex::accounts
