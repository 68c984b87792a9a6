/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "primitives/types.hpp"

namespace datex::accounts {
  using primitives::AccountId;
  using primitives::Address;
  using primitives::Hash256;

  enum class AccountStatus : uint8_t {
    kNone = 0,
    kTemporary,
    kCreated,
  };

  struct Account {
    AccountId id;
    /// zero address while the account is temporary
    Address owner;
    AccountStatus status{AccountStatus::kNone};
    /// creator of a temporary account, allowed to unlock it
    boost::optional<Address> controller;
    boost::optional<Hash256> identity_hash;
    /// signer of the password signature given on unlock
    boost::optional<Address> password_proof;
  };
}  // namespace datex::accounts
