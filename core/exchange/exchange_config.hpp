/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>

#include "primitives/types.hpp"

namespace datex::exchange {

  struct ExchangeConfig {
    /// max number of data ids bundled in one offer
    size_t max_data_ids{128};
    /// ticks between order and expiry
    primitives::Height offer_timeout{600};
    /// reject settle and reject after expiry
    bool enforce_expiry{false};
  };

}  // namespace datex::exchange
