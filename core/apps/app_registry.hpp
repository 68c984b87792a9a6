/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace datex::apps {
  using primitives::Address;
  using primitives::Hash256;

  struct App {
    std::string name;
    Address owner;
    /// blake2b-256 of the name
    Hash256 hashed_name;
  };

  /**
   * Registry of named applications, resolves an app name to its owner
   */
  class AppRegistry {
   public:
    virtual ~AppRegistry() = default;

    /**
     * Registers new app owned by sender
     * @param sender - caller, becomes the owner
     * @param name - unique non-empty name
     */
    virtual outcome::result<void> registerApp(const Address &sender,
                                              const std::string &name) = 0;

    /// Removes app, owner only
    virtual outcome::result<void> unregisterApp(const Address &sender,
                                                const std::string &name) = 0;

    /// Changes owner of the app, owner only
    virtual outcome::result<void> transferOwnership(
        const Address &sender,
        const std::string &name,
        const Address &new_owner) = 0;

    virtual bool exists(const std::string &name) const = 0;

    virtual outcome::result<App> get(const std::string &name) const = 0;

    /// False for unknown apps
    virtual bool isOwner(const std::string &name,
                         const Address &identity) const = 0;
  };

}  // namespace datex::apps
