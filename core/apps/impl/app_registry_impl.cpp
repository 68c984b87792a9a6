/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "apps/impl/app_registry_impl.hpp"

#include "apps/app_registry_error.hpp"
#include "crypto/blake2/blake2b.hpp"

namespace datex::apps {
  using crypto::blake2b::blake2b_256;

  AppRegistryImpl::AppRegistryImpl() : logger_{common::createLogger("apps")} {}

  outcome::result<void> AppRegistryImpl::registerApp(const Address &sender,
                                                     const std::string &name) {
    if (name.empty()) {
      return AppRegistryError::kEmptyName;
    }
    if (exists(name)) {
      return AppRegistryError::kAppAlreadyExists;
    }
    auto hashed_name = blake2b_256(asBytes(name));
    apps_.emplace(name, App{name, sender, hashed_name});
    logger_->info("app '{}' registered by {}", name, sender.toHex());
    return outcome::success();
  }

  outcome::result<void> AppRegistryImpl::unregisterApp(
      const Address &sender, const std::string &name) {
    OUTCOME_TRY(ownedBy(sender, name));
    apps_.erase(name);
    logger_->info("app '{}' unregistered", name);
    return outcome::success();
  }

  outcome::result<void> AppRegistryImpl::transferOwnership(
      const Address &sender, const std::string &name, const Address &new_owner) {
    OUTCOME_TRY(app, ownedBy(sender, name));
    app->owner = new_owner;
    logger_->info("app '{}' transferred to {}", name, new_owner.toHex());
    return outcome::success();
  }

  bool AppRegistryImpl::exists(const std::string &name) const {
    return apps_.find(name) != apps_.end();
  }

  outcome::result<App> AppRegistryImpl::get(const std::string &name) const {
    auto it = apps_.find(name);
    if (it == apps_.end()) {
      return AppRegistryError::kAppNotFound;
    }
    return it->second;
  }

  bool AppRegistryImpl::isOwner(const std::string &name,
                                const Address &identity) const {
    auto it = apps_.find(name);
    return it != apps_.end() && it->second.owner == identity;
  }

  outcome::result<App *> AppRegistryImpl::ownedBy(const Address &sender,
                                                  const std::string &name) {
    auto it = apps_.find(name);
    if (it == apps_.end()) {
      return AppRegistryError::kAppNotFound;
    }
    if (it->second.owner != sender) {
      return AppRegistryError::kNotOwner;
    }
    return &it->second;
  }

}  // namespace datex::apps
