// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_ACTIVE_OPERATION_REGISTRY_HPP
#define CIRRUS_ACTIVE_OPERATION_REGISTRY_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * Process-wide map of upload id to the operation currently executing it.
 *
 * Holds at most one operation per id. An entry exists only between the
 * moment a worker starts executing an operation and the moment execute()
 * returns. Used to cancel running transfers from outside the worker.
 *
 * Thread-safe: shared by all concurrently running workers.
 */
class ActiveOperationRegistry {
public:
  ActiveOperationRegistry() = default;

  // Non-copyable, non-movable
  ActiveOperationRegistry(const ActiveOperationRegistry&) = delete;
  ActiveOperationRegistry& operator=(const ActiveOperationRegistry&) = delete;

  /**
   * Register an operation
   *
   * @return false if id is already registered or operation is null
   */
  bool add(int64_t id, std::shared_ptr<IUploadOperation> operation);

  /**
   * @return true if an entry was removed
   */
  bool remove(int64_t id);

  std::shared_ptr<IUploadOperation> get(int64_t id) const;

  bool contains(int64_t id) const;

  /**
   * Signal the operation registered for id to abort.
   * The entry stays until its worker deregisters it.
   *
   * @return false if nothing is registered under id
   */
  bool cancel(int64_t id);

  /**
   * Signal every registered operation whose id is in ids
   *
   * @return Number of operations signalled
   */
  size_t cancel(const std::vector<int64_t>& ids);

  /**
   * @return Number of operations signalled
   */
  size_t cancelAll();

  std::vector<int64_t> ids() const;

  size_t size() const;

  bool empty() const;

  /**
   * Drop all entries without cancelling them (shutdown and test teardown)
   */
  void clear();

  /**
   * Scoped registration. Removes the entry on destruction, whatever the
   * outcome of the guarded execute() call.
   */
  class Registration {
  public:
    Registration(ActiveOperationRegistry& registry, int64_t id,
                 std::shared_ptr<IUploadOperation> operation);
    ~Registration();

    Registration(const Registration&) = delete;
    Registration& operator=(const Registration&) = delete;

    /**
     * false if the id was already held by another operation
     */
    bool registered() const {
      return registered_;
    }

  private:
    ActiveOperationRegistry& registry_;
    int64_t id_;
    bool registered_;
  };

private:
  mutable std::mutex mutex_;
  std::map<int64_t, std::shared_ptr<IUploadOperation>> operations_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_ACTIVE_OPERATION_REGISTRY_HPP
