/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "accounts/account_registry_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(datex::accounts, AccountRegistryError, e) {
  using E = datex::accounts::AccountRegistryError;
  switch (e) {
    case E::kAccountAlreadyExists:
      return "AccountRegistryError: account already exists";
    case E::kIdentityAlreadyRegistered:
      return "AccountRegistryError: identity hash already registered";
    case E::kAccountNotFound:
      return "AccountRegistryError: account does not exist";
    case E::kNotTemporary:
      return "AccountRegistryError: account is not temporary";
    case E::kNotController:
      return "AccountRegistryError: sender is not the controller";
  }
  return "AccountRegistryError: unknown error";
}
