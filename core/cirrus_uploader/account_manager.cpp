// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "account_manager.hpp"

namespace cirrus {
namespace uploader {

StaticAccountManager::StaticAccountManager(const std::vector<User>& users) {
  for (const auto& user : users) {
    addAccount(user);
  }
}

AccountLookup StaticAccountManager::resolve(const std::string& account_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = users_.find(account_name);
  if (it == users_.end()) {
    return AccountNotFound{account_name};
  }
  return AccountFound{it->second};
}

bool StaticAccountManager::addAccount(const User& user) {
  if (user.account_name.find_first_not_of(" \t\r\n") == std::string::npos) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  return users_.emplace(user.account_name, user).second;
}

bool StaticAccountManager::removeAccount(const std::string& account_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return users_.erase(account_name) > 0;
}

std::vector<User> StaticAccountManager::accounts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<User> result;
  result.reserve(users_.size());
  for (const auto& entry : users_) {
    result.push_back(entry.second);
  }
  return result;
}

}  // namespace uploader
}  // namespace cirrus
