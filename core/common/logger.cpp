/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace datex::common {
  namespace {
    constexpr auto kPattern{"[%Y-%m-%d %H:%M:%S.%e][%l][%n] %v"};

    std::mutex &loggersMutex() {
      static std::mutex mutex;
      return mutex;
    }

    spdlog::sink_ptr &fileSink() {
      static spdlog::sink_ptr sink;
      return sink;
    }

    Logger makeLogger(const std::string &tag) {
      auto logger{spdlog::stdout_color_mt(tag)};
      if (fileSink()) {
        logger->sinks().push_back(fileSink());
      }
      logger->set_pattern(kPattern);
      logger->set_level(spdlog::get_level());
      return logger;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    std::lock_guard lock{loggersMutex()};
    auto logger{spdlog::get(tag)};
    if (logger == nullptr) {
      logger = makeLogger(tag);
    }
    return logger;
  }

  void addFileSink(const std::string &path) {
    std::lock_guard lock{loggersMutex()};
    auto sink{std::make_shared<spdlog::sinks::basic_file_sink_mt>(path)};
    sink->set_pattern(kPattern);
    fileSink() = sink;
    spdlog::apply_all([&](const Logger &logger) {
      logger->sinks().push_back(sink);
    });
  }

  spdlog::level::level_enum logLevelFromChar(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
      default:
        return spdlog::level::info;
    }
  }
}  // namespace datex::common
