// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_notifier.hpp"

#define CIRRUS_LOG_COMPONENT "notifier"
#include <cirrus_log_macros.hpp>

using cirrus::logging::kv;

namespace cirrus {
namespace uploader {

void LoggingUploadNotifier::reportStart(const UploadRecord& record) {
  stats_.started++;
  CIRRUS_LOG_INFO(
    "Uploading " << record.local_path << kv("upload_id", record.id)
                 << kv("remote_path", record.remote_path)
  );
}

void LoggingUploadNotifier::reportProgress(
  const UploadRecord& record, uint64_t bytes_transferred, uint64_t total_bytes
) {
  int percent = total_bytes > 0 ? static_cast<int>(bytes_transferred * 100 / total_bytes) : 100;
  CIRRUS_LOG_DEBUG_THROTTLE(
    1.0, "Upload progress" << kv("upload_id", record.id) << kv("percent", percent)
  );
}

void LoggingUploadNotifier::reportResult(const UploadRecord& record, ResultClass result_class) {
  switch (result_class) {
    case ResultClass::SUCCESS:
      stats_.succeeded++;
      CIRRUS_LOG_INFO("Uploaded " << record.local_path << kv("upload_id", record.id));
      break;
    case ResultClass::BENIGN_SKIP:
      stats_.skipped++;
      CIRRUS_LOG_DEBUG("Skipped " << record.local_path << kv("upload_id", record.id));
      break;
    case ResultClass::RETRYABLE:
      stats_.retryable++;
      CIRRUS_LOG_WARN("Upload will be retried: " << record.local_path << kv("upload_id", record.id));
      break;
    case ResultClass::FATAL:
      stats_.failed++;
      CIRRUS_LOG_ERROR("Upload failed: " << record.local_path << kv("upload_id", record.id));
      break;
  }
}

void LoggingUploadNotifier::reportBatchSummary(const BatchSummary& summary) {
  stats_.batches++;
  CIRRUS_LOG_INFO(
    "Batch " << summary.batch_index + 1 << "/" << summary.total_batches << " of "
             << summary.account_name << ": " << summary.succeeded << " uploaded, "
             << summary.failed << " failed, " << summary.retryable << " to retry"
             << kv("skipped", summary.skipped) << kv("not_started", summary.not_started)
  );
}

}  // namespace uploader
}  // namespace cirrus
