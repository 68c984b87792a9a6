/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/endian/conversion.hpp>
#include <boost/optional.hpp>

#include "common/bytes.hpp"

namespace datex::common {
  inline void putUint64BigEndian(Bytes &l, uint64_t n) {
    l.resize(l.size() + sizeof(n));
    boost::endian::store_big_u64(&(*(l.end() - sizeof(n))), n);
  }

  /// Reads big-endian uint64 at offset, none if input is too short
  inline boost::optional<uint64_t> readUint64BigEndian(BytesIn in,
                                                       size_t offset) {
    if (static_cast<size_t>(in.size()) < offset + sizeof(uint64_t)) {
      return boost::none;
    }
    return boost::endian::load_big_u64(in.data() + offset);
  }
}  // namespace datex::common
