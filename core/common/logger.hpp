/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace datex::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Returns logger writing to colored stdout, created on first request
   * @param tag - name shown in every record of the logger
   */
  Logger createLogger(const std::string &tag);

  /**
   * Duplicates records of existing and future loggers to file
   * @param path - log file, appended if exists
   */
  void addFileSink(const std::string &path);

  /// One letter level [e,w,i,d,t] to spdlog level, anything else is info
  spdlog::level::level_enum logLevelFromChar(char level);
}  // namespace datex::common
