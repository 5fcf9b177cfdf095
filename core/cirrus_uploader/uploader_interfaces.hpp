// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOADER_INTERFACES_HPP
#define CIRRUS_UPLOADER_INTERFACES_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "result_code.hpp"
#include "upload_record.hpp"

namespace cirrus {
namespace uploader {

/**
 * Connection handle for one account's remote storage
 */
struct RemoteClient {
  std::string account_name;
  std::string endpoint;
};

/**
 * Device state captured when an operation is built
 */
struct OperationContext {
  bool connected = true;
  bool internet_walled = false;
  bool battery_charging = false;
  bool power_save_mode = false;
  int batch_index = 0;
  int total_batches = 1;
};

/**
 * Aggregate counts reported once per batch
 */
struct BatchSummary {
  std::string account_name;
  int batch_index = 0;
  int total_batches = 1;
  size_t total = 0;
  size_t succeeded = 0;
  size_t skipped = 0;
  size_t retryable = 0;
  size_t failed = 0;
  size_t not_started = 0;  // Left untouched after a fatal short-circuit
  WorkResult result = WorkResult::SUCCESS;
};

/**
 * Persisted queue of upload records
 */
class IUploadStore {
public:
  virtual ~IUploadStore() = default;

  /**
   * Persist a new record. The id field of the argument is ignored.
   * @return The assigned id, or std::nullopt on a storage error
   */
  virtual std::optional<int64_t> insertUpload(const UploadRecord& record) = 0;

  virtual std::optional<UploadRecord> getUpload(int64_t id) const = 0;

  /**
   * Records whose id is in ids and whose account matches, ordered by id
   */
  virtual std::vector<UploadRecord> getUploadsByIds(
    const std::vector<int64_t>& ids, const std::string& account_name
  ) const = 0;

  /**
   * Records in PENDING or IN_PROGRESS state for all accounts, ordered by id
   */
  virtual std::vector<UploadRecord> getPendingUploads() const = 0;

  /**
   * All records of one account, ordered by id
   */
  virtual std::vector<UploadRecord> getUploadsForAccount(const std::string& account_name) const = 0;

  /**
   * @return true if a record was updated
   */
  virtual bool updateUploadStatus(int64_t id, UploadStatus status, ResultCode last_result) = 0;

  virtual bool removeUpload(int64_t id) = 0;
};

class IAccountManager {
public:
  virtual ~IAccountManager() = default;
  virtual AccountLookup resolve(const std::string& account_name) const = 0;
};

class IPreferences {
public:
  virtual ~IPreferences() = default;
  virtual bool isGlobalUploadPaused() const = 0;
  virtual void setGlobalUploadPaused(bool paused) = 0;
};

class IConnectivityService {
public:
  virtual ~IConnectivityService() = default;
  virtual bool isConnected() const = 0;

  /**
   * True when a network is up but traffic is intercepted (captive portal)
   */
  virtual bool isInternetWalled() const = 0;
};

class IPowerManagementService {
public:
  virtual ~IPowerManagementService() = default;
  virtual bool isBatteryCharging() const = 0;
  virtual bool isPowerSaveMode() const = 0;
};

/**
 * Progress callback: bytes transferred so far, total bytes
 */
using ProgressListener = std::function<void(uint64_t, uint64_t)>;

/**
 * One single-file transfer
 */
class IUploadOperation {
public:
  virtual ~IUploadOperation() = default;

  /**
   * Run the transfer. May block on I/O.
   * Returns CANCELLED if cancel() was called before or during execution.
   */
  virtual ResultCode execute(RemoteClient& client) = 0;

  /**
   * Request abort. Safe to call from any thread.
   */
  virtual void cancel() = 0;

  virtual bool isCancelled() const = 0;

  virtual void setProgressListener(ProgressListener listener) = 0;
};

class IUploadOperationFactory {
public:
  virtual ~IUploadOperationFactory() = default;

  /**
   * @return The operation, or nullptr if none can be built for the record
   */
  virtual std::shared_ptr<IUploadOperation> create(
    const UploadRecord& record, const User& user, const OperationContext& context
  ) = 0;
};

class IClientFactory {
public:
  virtual ~IClientFactory() = default;

  /**
   * @return A client for the user's account, or nullptr if it cannot be created
   */
  virtual std::shared_ptr<RemoteClient> create(const User& user) = 0;
};

/**
 * User-facing progress reporting. Implementations may throw; callers
 * treat every exception as non-fatal.
 */
class IUploadNotifier {
public:
  virtual ~IUploadNotifier() = default;
  virtual void reportStart(const UploadRecord& record) = 0;
  virtual void reportProgress(
    const UploadRecord& record, uint64_t bytes_transferred, uint64_t total_bytes
  ) = 0;
  virtual void reportResult(const UploadRecord& record, ResultClass result_class) = 0;
  virtual void reportBatchSummary(const BatchSummary& summary) = 0;
};

/**
 * Fire-and-forget event publication for observers
 */
class IBroadcastEmitter {
public:
  virtual ~IBroadcastEmitter() = default;
  virtual void emit(const std::string& type, const nlohmann::json& data) = 0;
};

/**
 * Queues upload batches for background execution
 */
class IUploadJobScheduler {
public:
  virtual ~IUploadJobScheduler() = default;

  /**
   * @return Ids of the created jobs
   */
  virtual std::vector<uint64_t> scheduleUploads(
    const std::string& account_name, const std::vector<int64_t>& upload_ids
  ) = 0;
};

/**
 * Filesystem operations used by transfers and the upload helper
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  virtual bool exists(const std::string& path) const = 0;

  virtual bool is_regular_file(const std::string& path) const = 0;

  /**
   * @return Size in bytes, 0 if the file does not exist
   */
  virtual uint64_t file_size(const std::string& path) const = 0;

  /**
   * Sum of the sizes of all regular files below path
   */
  virtual uint64_t directory_size(const std::string& path) const = 0;

  virtual bool remove(const std::string& path) const = 0;

  virtual bool rename(const std::string& old_path, const std::string& new_path) const = 0;

  virtual bool copy_file(const std::string& from, const std::string& to) const = 0;

  /**
   * Create directory tree (including parent directories)
   */
  virtual bool create_directories(const std::string& path) const = 0;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_UPLOADER_INTERFACES_HPP
