/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace datex::accounts {

  enum class AccountRegistryError {
    kAccountAlreadyExists = 1,
    kIdentityAlreadyRegistered,
    kAccountNotFound,
    kNotTemporary,
    kNotController,
  };

}  // namespace datex::accounts

OUTCOME_HPP_DECLARE_ERROR(datex::accounts, AccountRegistryError);
