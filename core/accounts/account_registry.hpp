/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "accounts/account.hpp"
#include "common/outcome.hpp"
#include "crypto/secp256k1/secp256k1_types.hpp"

namespace datex::accounts {
  using crypto::secp256k1::MessageHash;
  using crypto::secp256k1::Signature;

  /**
   * Resolves cryptographic identities to stable account handles
   */
  class AccountRegistry {
   public:
    virtual ~AccountRegistry() = default;

    /// Creates account owned by sender
    virtual outcome::result<AccountId> create(const Address &sender) = 0;

    /**
     * Creates account bound to an identity hash, sender becomes its
     * controller
     */
    virtual outcome::result<AccountId> createTemporary(
        const Address &sender, const Hash256 &identity_hash) = 0;

    /**
     * Turns temporary account into created one owned by new_owner
     * @param sender - controller of the temporary account
     * @param identity_preimage - data hashing to the identity hash
     * @param new_owner - owner of the account after unlock
     * @param password_signature - signature of
     * blake2b-256(identity_preimage || new_owner)
     */
    virtual outcome::result<void> unlockTemporary(
        const Address &sender,
        BytesIn identity_preimage,
        const Address &new_owner,
        const Signature &password_signature) = 0;

    /// Account whose password proof is the signer of the message
    virtual outcome::result<AccountId> getAccountIdFromSignature(
        const MessageHash &message_hash, const Signature &signature) const = 0;

    virtual outcome::result<Account> getAccount(const AccountId &id) const = 0;

    virtual outcome::result<AccountId> getAccountId(
        const Address &owner) const = 0;
  };

}  // namespace datex::accounts
