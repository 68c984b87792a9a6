/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "common/blob.hpp"

namespace datex::primitives {
  using common::Hash256;

  /// Logical clock value, the ledger height
  using Height = int64_t;

  /// Identity of a caller
  using Address = common::Blob<20>;

  /// Content identifier of a bundled data item
  using DataId = common::Blob<20>;

  /// Opaque handle of an offer
  using OfferId = common::Blob<8>;

  /// Opaque handle of an account
  using AccountId = common::Blob<8>;

  /// Method selector of an escrow call
  using Selector = common::Blob<4>;
}  // namespace datex::primitives
