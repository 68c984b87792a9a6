/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace datex::apps {

  enum class AppRegistryError {
    kEmptyName = 1,
    kAppAlreadyExists,
    kAppNotFound,
    kNotOwner,
  };

}  // namespace datex::apps

OUTCOME_HPP_DECLARE_ERROR(datex::apps, AppRegistryError);
