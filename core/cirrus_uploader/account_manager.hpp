// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_ACCOUNT_MANAGER_HPP
#define CIRRUS_ACCOUNT_MANAGER_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * Account manager backed by the accounts listed in the configuration
 */
class StaticAccountManager : public IAccountManager {
public:
  StaticAccountManager() = default;
  explicit StaticAccountManager(const std::vector<User>& users);

  AccountLookup resolve(const std::string& account_name) const override;

  /**
   * @return false if account_name is blank or already known
   */
  bool addAccount(const User& user);

  bool removeAccount(const std::string& account_name);

  std::vector<User> accounts() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, User> users_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_ACCOUNT_MANAGER_HPP
