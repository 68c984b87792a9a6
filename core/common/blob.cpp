/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(datex::common, BlobError, e) {
  using datex::common::BlobError;

  switch (e) {
    case BlobError::kIncorrectLength:
      return "BlobError: input has incorrect length, not matching the blob "
             "size";
  }

  return "BlobError: unknown error";
}

namespace datex::common {
  template class Blob<4ul>;
  template class Blob<8ul>;
  template class Blob<20ul>;
  template class Blob<32ul>;
}  // namespace datex::common
