/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/error_text.hpp"

#include <cstring>
#include <mutex>
#include <vector>

namespace datex::error_text {
  namespace {
    class TextRegistry {
     public:
      int add(const char *message) {
        std::lock_guard lock{mutex_};
        for (size_t i{0}; i < messages_.size(); ++i) {
          if (messages_[i] == message
              || std::strcmp(messages_[i], message) == 0) {
            return static_cast<int>(i + 1);
          }
        }
        messages_.push_back(message);
        return static_cast<int>(messages_.size());
      }

      const char *find(int value) const {
        std::lock_guard lock{mutex_};
        if (value < 1 || static_cast<size_t>(value) > messages_.size()) {
          return nullptr;
        }
        return messages_[value - 1];
      }

     private:
      mutable std::mutex mutex_;
      std::vector<const char *> messages_;
    };

    TextRegistry &registry() {
      static TextRegistry registry;
      return registry;
    }

    class TextCategory : public std::error_category {
     public:
      const char *name() const noexcept override {
        return "ErrorText";
      }

      std::string message(int value) const override {
        if (const auto *text{registry().find(value)}) {
          return text;
        }
        return "ErrorText: unknown error";
      }
    };
  }  // namespace

  const std::error_category &category() {
    static const TextCategory category;
    return category;
  }

  std::error_code makeErrorCode(const char *message) {
    return {registry().add(message), category()};
  }
}  // namespace datex::error_text
