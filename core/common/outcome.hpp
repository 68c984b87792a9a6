/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/outcome/outcome.hpp>

/**
 * Unwraps a result where failure is unrecoverable.
 * Error is thrown as std::system_error by outcome's value().
 */
#define OUTCOME_EXCEPT(expr) (void)(expr).value()

namespace datex::outcome {
  using libp2p::outcome::failure;
  using libp2p::outcome::result;
  using libp2p::outcome::success;
}  // namespace datex::outcome
