// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_upload_worker.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <utility>
#include <variant>

#include "batch_input.hpp"

#define CIRRUS_LOG_COMPONENT "upload_worker"
#include <cirrus_log_macros.hpp>

using cirrus::logging::kv;

namespace cirrus {
namespace uploader {

namespace {

// Notifier and broadcast failures never affect the batch
template<typename Fn>
void reportSafely(const char* what, int64_t upload_id, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    CIRRUS_LOG_WARN(
      "Ignoring " << what << " failure" << kv("upload_id", upload_id) << kv("error", e.what())
    );
  }
}

nlohmann::json recordEvent(const UploadRecord& record) {
  nlohmann::json data;
  data["upload_id"] = record.id;
  data["account"] = record.account_name;
  data["local_path"] = record.local_path;
  data["remote_path"] = record.remote_path;
  return data;
}

bool alreadyFinished(const UploadRecord& record) {
  if (record.status == UploadStatus::DONE) {
    return true;
  }
  return record.status == UploadStatus::FAILED && record.last_result == ResultCode::CANCELLED;
}

}  // namespace

FileUploadWorker::FileUploadWorker(
  const WorkerCollaborators& collaborators, ActiveOperationRegistry& registry
)
    : deps_(collaborators)
    , registry_(registry) {}

WorkResult FileUploadWorker::execute(const BatchInput& input) {
  std::string error;
  if (!validateBatchInput(input, error)) {
    CIRRUS_LOG_ERROR("Rejecting upload batch: " << error);
    return WorkResult::FAILURE;
  }

  CIRRUS_LOG_SCOPED_CONTEXT(input.account_name, batchLabel(input));

  try {
    return executeBatch(input);
  } catch (const std::exception& e) {
    // Store, account or preference backends failed outside any single transfer
    CIRRUS_LOG_ERROR("Upload batch aborted" << kv("error", e.what()));
    return WorkResult::FAILURE;
  }
}

WorkResult FileUploadWorker::executeBatch(const BatchInput& input) {
  AccountLookup lookup = deps_.accounts.resolve(input.account_name);
  if (std::holds_alternative<AccountNotFound>(lookup)) {
    CIRRUS_LOG_ERROR("Account not found" << kv("account", input.account_name));
    return WorkResult::FAILURE;
  }
  const User user = std::get<AccountFound>(lookup).user;

  std::vector<UploadRecord> records =
    deps_.store.getUploadsByIds(input.upload_ids, input.account_name);

  last_summary_ = BatchSummary();
  last_summary_.account_name = input.account_name;
  last_summary_.batch_index = input.current_batch_index;
  last_summary_.total_batches = input.total_batches;
  last_summary_.total = records.size();

  if (records.empty()) {
    CIRRUS_LOG_INFO("No uploads to process" << kv("requested", input.upload_ids.size()));
    return WorkResult::SUCCESS;
  }

  if (deps_.preferences.isGlobalUploadPaused()) {
    CIRRUS_LOG_INFO("Uploads are globally paused" << kv("pending", records.size()));
    last_summary_.not_started = records.size();
    return WorkResult::SUCCESS;
  }

  std::shared_ptr<RemoteClient> client = deps_.client_factory.create(user);
  if (!client) {
    CIRRUS_LOG_ERROR("Cannot create remote client" << kv("account", user.account_name));
    return WorkResult::FAILURE;
  }

  CIRRUS_LOG_INFO("Starting upload batch" << kv("records", records.size()));

  BatchOutcome outcome;
  for (const auto& record : records) {
    outcome.add(processRecord(record, user, *client, input));

    if (outcome.shouldStop()) {
      CIRRUS_LOG_WARN(
        "Fatal upload error, stopping batch" << kv("upload_id", record.id)
                                             << kv("remaining", records.size() - outcome.processed())
      );
      break;
    }
  }

  last_summary_.succeeded = outcome.succeeded();
  last_summary_.skipped = outcome.skipped();
  last_summary_.retryable = outcome.retryable();
  last_summary_.failed = outcome.failed();
  last_summary_.not_started = records.size() - outcome.processed();
  last_summary_.result = outcome.result();

  notifySummary(last_summary_);

  CIRRUS_LOG_INFO(
    "Upload batch finished" << kv("result", workResultToString(last_summary_.result))
                            << kv("succeeded", last_summary_.succeeded)
                            << kv("skipped", last_summary_.skipped)
                            << kv("retryable", last_summary_.retryable)
                            << kv("failed", last_summary_.failed)
  );

  return last_summary_.result;
}

ResultClass FileUploadWorker::processRecord(
  const UploadRecord& record, const User& user, RemoteClient& client, const BatchInput& input
) {
  if (alreadyFinished(record)) {
    CIRRUS_LOG_DEBUG(
      "Skipping finished upload" << kv("upload_id", record.id)
                                 << kv("status", uploadStatusToString(record.status))
    );
    return ResultClass::BENIGN_SKIP;
  }

  // A cancel issued after the batch was loaded only reaches the stored row
  std::optional<UploadRecord> current = deps_.store.getUpload(record.id);
  if (!current) {
    CIRRUS_LOG_INFO("Upload record removed, skipping" << kv("upload_id", record.id));
    return ResultClass::BENIGN_SKIP;
  }
  if (alreadyFinished(*current)) {
    CIRRUS_LOG_INFO(
      "Upload finished outside this batch"
      << kv("upload_id", current->id) << kv("status", uploadStatusToString(current->status))
      << kv("last_result", resultCodeToString(current->last_result))
    );
    return ResultClass::BENIGN_SKIP;
  }

  OperationContext context = snapshotContext(input);

  ResultCode code;
  if (!context.connected || context.internet_walled) {
    code = ResultCode::NO_NETWORK_CONNECTION;
  } else {
    std::optional<ResultCode> executed = runOperation(*current, user, client, context);
    if (!executed) {
      return ResultClass::BENIGN_SKIP;
    }
    code = *executed;
  }

  ResultClass result_class = classifyResult(code);

  CIRRUS_LOG_INFO(
    "Upload finished" << kv("upload_id", record.id) << kv("code", resultCodeToString(code))
                      << kv("class", resultClassToString(result_class))
  );

  persistOutcome(*current, result_class, code);
  notifyResult(*current, result_class, code);

  return result_class;
}

std::optional<ResultCode> FileUploadWorker::runOperation(
  const UploadRecord& record, const User& user, RemoteClient& client,
  const OperationContext& context
) {
  std::shared_ptr<IUploadOperation> operation;
  try {
    operation = deps_.operation_factory.create(record, user, context);
  } catch (const std::exception& e) {
    CIRRUS_LOG_ERROR(
      "Failed to build upload operation" << kv("upload_id", record.id) << kv("error", e.what())
    );
    return ResultCode::UNKNOWN_ERROR;
  }
  if (!operation) {
    CIRRUS_LOG_ERROR("No upload operation for record" << kv("upload_id", record.id));
    return ResultCode::UNKNOWN_ERROR;
  }

  ActiveOperationRegistry::Registration registration(registry_, record.id, operation);
  if (!registration.registered()) {
    CIRRUS_LOG_WARN("Upload already running in another worker" << kv("upload_id", record.id));
    return std::nullopt;
  }

  if (!deps_.store.updateUploadStatus(record.id, UploadStatus::IN_PROGRESS, record.last_result)) {
    CIRRUS_LOG_WARN("Failed to mark upload in progress" << kv("upload_id", record.id));
  }

  notifyStart(record);

  operation->setProgressListener([this, record](uint64_t transferred, uint64_t total) {
    reportSafely("progress notification", record.id, [&]() {
      deps_.notifier.reportProgress(record, transferred, total);
    });
  });

  try {
    return operation->execute(client);
  } catch (const std::exception& e) {
    CIRRUS_LOG_ERROR("Upload operation threw" << kv("upload_id", record.id) << kv("error", e.what()));
    return ResultCode::UNKNOWN_ERROR;
  }
}

OperationContext FileUploadWorker::snapshotContext(const BatchInput& input) const {
  OperationContext context;
  context.connected = deps_.connectivity.isConnected();
  context.internet_walled = deps_.connectivity.isInternetWalled();
  context.battery_charging = deps_.power.isBatteryCharging();
  context.power_save_mode = deps_.power.isPowerSaveMode();
  context.batch_index = input.current_batch_index;
  context.total_batches = input.total_batches;
  return context;
}

void FileUploadWorker::persistOutcome(
  const UploadRecord& record, ResultClass result_class, ResultCode code
) {
  UploadStatus status = UploadStatus::PENDING;
  switch (result_class) {
    case ResultClass::SUCCESS:
      status = UploadStatus::DONE;
      break;
    case ResultClass::BENIGN_SKIP:
      // A skipped collision leaves nothing to do; a cancelled record is not retried
      status = code == ResultCode::SKIPPED_EXISTING ? UploadStatus::DONE : UploadStatus::FAILED;
      break;
    case ResultClass::RETRYABLE:
      status = UploadStatus::PENDING;
      break;
    case ResultClass::FATAL:
      status = UploadStatus::FAILED;
      break;
  }

  if (!deps_.store.updateUploadStatus(record.id, status, code)) {
    CIRRUS_LOG_WARN(
      "Failed to persist upload outcome" << kv("upload_id", record.id)
                                         << kv("status", uploadStatusToString(status))
    );
  }
}

void FileUploadWorker::notifyStart(const UploadRecord& record) {
  reportSafely("start notification", record.id, [&]() {
    deps_.notifier.reportStart(record);
  });
  reportSafely("start broadcast", record.id, [&]() {
    deps_.broadcaster.emit(kEventUploadStarted, recordEvent(record));
  });
}

void FileUploadWorker::notifyResult(
  const UploadRecord& record, ResultClass result_class, ResultCode code
) {
  reportSafely("result notification", record.id, [&]() {
    deps_.notifier.reportResult(record, result_class);
  });
  reportSafely("result broadcast", record.id, [&]() {
    nlohmann::json data = recordEvent(record);
    data["result_code"] = resultCodeToString(code);
    data["result_class"] = resultClassToString(result_class);
    deps_.broadcaster.emit(kEventUploadFinished, data);
  });
}

void FileUploadWorker::notifySummary(const BatchSummary& summary) {
  reportSafely("batch summary notification", -1, [&]() {
    deps_.notifier.reportBatchSummary(summary);
  });
  reportSafely("batch summary broadcast", -1, [&]() {
    nlohmann::json data;
    data["account"] = summary.account_name;
    data["batch_index"] = summary.batch_index;
    data["total_batches"] = summary.total_batches;
    data["total"] = summary.total;
    data["succeeded"] = summary.succeeded;
    data["skipped"] = summary.skipped;
    data["retryable"] = summary.retryable;
    data["failed"] = summary.failed;
    data["not_started"] = summary.not_started;
    data["result"] = workResultToString(summary.result);
    deps_.broadcaster.emit(kEventBatchFinished, data);
  });
}

}  // namespace uploader
}  // namespace cirrus
