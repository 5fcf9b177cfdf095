// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_FILE_UPLOAD_WORKER_HPP
#define CIRRUS_FILE_UPLOAD_WORKER_HPP

#include <optional>
#include <string>
#include <vector>

#include "active_operation_registry.hpp"
#include "result_code.hpp"
#include "upload_record.hpp"
#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

// Broadcast event types
constexpr const char* kEventUploadStarted = "upload_started";
constexpr const char* kEventUploadFinished = "upload_finished";
constexpr const char* kEventBatchFinished = "batch_finished";

/**
 * Services a worker talks to. All references must outlive the worker.
 */
struct WorkerCollaborators {
  IAccountManager& accounts;
  IUploadStore& store;
  IPreferences& preferences;
  IConnectivityService& connectivity;
  IPowerManagementService& power;
  IUploadOperationFactory& operation_factory;
  IClientFactory& client_factory;
  IUploadNotifier& notifier;
  IBroadcastEmitter& broadcaster;
};

/**
 * Runs one batch of queued uploads for one account.
 *
 * Records are processed strictly in store order, one at a time:
 *   build operation -> register -> execute -> classify -> deregister -> notify
 *
 * The aggregate result tells the scheduler what to do with the batch:
 * - FAILURE: bad input, unknown account, or a fatal transfer error. A fatal
 *   error stops the batch immediately.
 * - RETRY: at least one retryable error and no fatal error.
 * - SUCCESS: everything else, including an empty batch and global pause.
 *
 * The worker never sleeps or retries on its own. execute() does not throw.
 *
 * Usage:
 *   FileUploadWorker worker(collaborators, registry);
 *   WorkResult result = worker.execute(batch);
 */
class FileUploadWorker {
public:
  FileUploadWorker(const WorkerCollaborators& collaborators, ActiveOperationRegistry& registry);

  // Non-copyable, non-movable
  FileUploadWorker(const FileUploadWorker&) = delete;
  FileUploadWorker& operator=(const FileUploadWorker&) = delete;

  WorkResult execute(const BatchInput& input);

  /**
   * Summary of the last execute() call that got past account resolution
   */
  const BatchSummary& lastSummary() const {
    return last_summary_;
  }

private:
  WorkResult executeBatch(const BatchInput& input);

  ResultClass processRecord(
    const UploadRecord& record, const User& user, RemoteClient& client, const BatchInput& input
  );

  // std::nullopt when another worker already runs this record
  std::optional<ResultCode> runOperation(
    const UploadRecord& record, const User& user, RemoteClient& client,
    const OperationContext& context
  );

  OperationContext snapshotContext(const BatchInput& input) const;

  void persistOutcome(const UploadRecord& record, ResultClass result_class, ResultCode code);

  void notifyStart(const UploadRecord& record);
  void notifyResult(const UploadRecord& record, ResultClass result_class, ResultCode code);
  void notifySummary(const BatchSummary& summary);

  WorkerCollaborators deps_;
  ActiveOperationRegistry& registry_;
  BatchSummary last_summary_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_FILE_UPLOAD_WORKER_HPP
