/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "apps/app_registry_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(datex::apps, AppRegistryError, e) {
  using E = datex::apps::AppRegistryError;
  switch (e) {
    case E::kEmptyName:
      return "AppRegistryError: app name is empty";
    case E::kAppAlreadyExists:
      return "AppRegistryError: app name already exists";
    case E::kAppNotFound:
      return "AppRegistryError: app does not exist";
    case E::kNotOwner:
      return "AppRegistryError: only owner of the app";
  }
  return "AppRegistryError: unknown error";
}
