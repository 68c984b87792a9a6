/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace datex::clock {
  /// Seconds since unix epoch
  using UnixTime = std::chrono::seconds;
}  // namespace datex::clock
