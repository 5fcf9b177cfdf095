// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "active_operation_registry.hpp"

#include <utility>

namespace cirrus {
namespace uploader {

bool ActiveOperationRegistry::add(int64_t id, std::shared_ptr<IUploadOperation> operation) {
  if (!operation) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  return operations_.emplace(id, std::move(operation)).second;
}

bool ActiveOperationRegistry::remove(int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return operations_.erase(id) > 0;
}

std::shared_ptr<IUploadOperation> ActiveOperationRegistry::get(int64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = operations_.find(id);
  if (it == operations_.end()) {
    return nullptr;
  }
  return it->second;
}

bool ActiveOperationRegistry::contains(int64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return operations_.count(id) > 0;
}

bool ActiveOperationRegistry::cancel(int64_t id) {
  // cancel() runs outside the lock; the operation may call back into us
  auto operation = get(id);
  if (!operation) {
    return false;
  }
  operation->cancel();
  return true;
}

size_t ActiveOperationRegistry::cancel(const std::vector<int64_t>& ids) {
  size_t cancelled = 0;
  for (int64_t id : ids) {
    if (cancel(id)) {
      ++cancelled;
    }
  }
  return cancelled;
}

size_t ActiveOperationRegistry::cancelAll() {
  std::vector<std::shared_ptr<IUploadOperation>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(operations_.size());
    for (const auto& entry : operations_) {
      snapshot.push_back(entry.second);
    }
  }

  for (const auto& operation : snapshot) {
    operation->cancel();
  }
  return snapshot.size();
}

std::vector<int64_t> ActiveOperationRegistry::ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<int64_t> result;
  result.reserve(operations_.size());
  for (const auto& entry : operations_) {
    result.push_back(entry.first);
  }
  return result;
}

size_t ActiveOperationRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return operations_.size();
}

bool ActiveOperationRegistry::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return operations_.empty();
}

void ActiveOperationRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  operations_.clear();
}

ActiveOperationRegistry::Registration::Registration(
  ActiveOperationRegistry& registry, int64_t id, std::shared_ptr<IUploadOperation> operation
)
    : registry_(registry)
    , id_(id)
    , registered_(registry.add(id, std::move(operation))) {}

ActiveOperationRegistry::Registration::~Registration() {
  // Only the owner of the entry may remove it
  if (registered_) {
    registry_.remove(id_);
  }
}

}  // namespace uploader
}  // namespace cirrus
