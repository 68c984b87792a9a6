/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string/case_conv.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(datex::common, UnhexError, e) {
  using datex::common::UnhexError;
  switch (e) {
    case UnhexError::kNonHexInput:
      return "UnhexError: input contains non-hex characters";
    case UnhexError::kNotEnoughInput:
      return "UnhexError: input contains odd number of characters";
  }
  return "UnhexError: unknown error";
}

namespace datex::common {
  std::string hex_lower(BytesIn bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(),
                                std::back_inserter(res));
    return res;
  }

  outcome::result<Bytes> unhex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
      hex.remove_prefix(2);
    }
    Bytes bytes;
    bytes.reserve(hex.size() / 2);
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(bytes));
    } catch (const boost::algorithm::not_enough_input &) {
      return UnhexError::kNotEnoughInput;
    } catch (const boost::algorithm::non_hex_input &) {
      return UnhexError::kNonHexInput;
    }
    return bytes;
  }
}  // namespace datex::common
