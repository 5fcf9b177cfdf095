// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_helper.hpp"

#define CIRRUS_LOG_COMPONENT "upload_helper"
#include <cirrus_log_macros.hpp>

using cirrus::logging::kv;

namespace cirrus {
namespace uploader {

UploadHelper::UploadHelper(
  IUploadStore& store, IUploadJobScheduler& scheduler, const IFileSystem& filesystem
)
    : store_(store)
    , scheduler_(scheduler)
    , filesystem_(filesystem) {}

std::vector<int64_t> UploadHelper::uploadNewFiles(
  const User& user, const std::vector<std::string>& local_paths,
  const std::vector<std::string>& remote_paths, LocalBehaviour local_behaviour,
  CreatedBy created_by, NameCollisionPolicy name_collision_policy
) {
  std::vector<int64_t> ids;

  if (local_paths.size() != remote_paths.size()) {
    CIRRUS_LOG_ERROR(
      "Cannot queue uploads - path lists differ" << kv("local", local_paths.size())
                                                 << kv("remote", remote_paths.size())
    );
    return ids;
  }

  for (size_t i = 0; i < local_paths.size(); ++i) {
    UploadRecord record;
    record.account_name = user.account_name;
    record.local_path = local_paths[i];
    record.remote_path = remote_paths[i];
    record.local_behaviour = local_behaviour;
    record.created_by = created_by;
    record.name_collision_policy = name_collision_policy;
    record.status = UploadStatus::PENDING;
    // A missing file is reported by the worker
    record.file_size_bytes = filesystem_.file_size(local_paths[i]);

    auto id = store_.insertUpload(record);
    if (!id) {
      CIRRUS_LOG_ERROR("Failed to store upload" << kv("local_path", local_paths[i]));
      continue;
    }
    ids.push_back(*id);
  }

  if (!ids.empty()) {
    scheduler_.scheduleUploads(user.account_name, ids);
  }
  return ids;
}

size_t UploadHelper::retryFailedUploads(const std::string& account_name) {
  std::vector<int64_t> ids;
  for (const auto& record : store_.getUploadsForAccount(account_name)) {
    if (record.status != UploadStatus::FAILED) {
      continue;
    }
    if (store_.updateUploadStatus(record.id, UploadStatus::PENDING, record.last_result)) {
      ids.push_back(record.id);
    }
  }

  if (!ids.empty()) {
    scheduler_.scheduleUploads(account_name, ids);
  }
  CIRRUS_LOG_INFO("Re-queued failed uploads" << kv("account", account_name) << kv("count", ids.size()));
  return ids.size();
}

}  // namespace uploader
}  // namespace cirrus
