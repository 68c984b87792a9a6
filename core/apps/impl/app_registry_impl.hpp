/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "apps/app_registry.hpp"
#include "common/logger.hpp"

namespace datex::apps {

  class AppRegistryImpl : public AppRegistry {
   public:
    AppRegistryImpl();

    outcome::result<void> registerApp(const Address &sender,
                                      const std::string &name) override;

    outcome::result<void> unregisterApp(const Address &sender,
                                        const std::string &name) override;

    outcome::result<void> transferOwnership(const Address &sender,
                                            const std::string &name,
                                            const Address &new_owner) override;

    bool exists(const std::string &name) const override;

    outcome::result<App> get(const std::string &name) const override;

    bool isOwner(const std::string &name,
                 const Address &identity) const override;

   private:
    outcome::result<App *> ownedBy(const Address &sender,
                                   const std::string &name);

    std::map<std::string, App> apps_;
    common::Logger logger_;
  };

}  // namespace datex::apps
