// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "mirror_transfer.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>

#define CIRRUS_LOG_COMPONENT "mirror_transfer"
#include <cirrus_log_macros.hpp>

using cirrus::logging::kv;

namespace fs = std::filesystem;

namespace cirrus {
namespace uploader {

namespace {

std::string stripLeadingSlashes(const std::string& path) {
  size_t start = path.find_first_not_of('/');
  return start == std::string::npos ? std::string() : path.substr(start);
}

}  // namespace

bool isValidRemotePath(const std::string& remote_path) {
  std::string relative = stripLeadingSlashes(remote_path);
  if (relative.empty()) {
    return false;
  }

  for (unsigned char c : relative) {
    if (c < 0x20 || c == 0x7f) {
      return false;
    }
  }
  if (relative.find_first_of("\\:*?\"<>|") != std::string::npos) {
    return false;
  }

  size_t start = 0;
  while (start <= relative.size()) {
    size_t end = relative.find('/', start);
    if (end == std::string::npos) {
      end = relative.size();
    }
    std::string segment = relative.substr(start, end - start);
    if (segment.empty() || segment == "." || segment == "..") {
      return false;
    }
    start = end + 1;
  }
  return true;
}

std::string resolveCollisionNameImpl(const std::string& target, const IFileSystem& filesystem) {
  fs::path path(target);
  std::string stem = path.stem().string();
  std::string extension = path.extension().string();
  fs::path parent = path.parent_path();

  for (int n = 2;; ++n) {
    fs::path candidate = parent / (stem + " (" + std::to_string(n) + ")" + extension);
    if (!filesystem.exists(candidate.string())) {
      return candidate.string();
    }
  }
}

bool applyLocalBehaviourImpl(
  const UploadRecord& record, const std::string& local_storage_root, const IFileSystem& filesystem
) {
  switch (record.local_behaviour) {
    case LocalBehaviour::FORGET:
      return true;

    case LocalBehaviour::DELETE:
      return filesystem.remove(record.local_path);

    case LocalBehaviour::COPY:
    case LocalBehaviour::MOVE: {
      if (local_storage_root.empty()) {
        return true;
      }
      fs::path dest =
        fs::path(local_storage_root) / record.account_name / stripLeadingSlashes(record.remote_path);
      if (!filesystem.create_directories(dest.parent_path().string())) {
        return false;
      }
      if (record.local_behaviour == LocalBehaviour::COPY) {
        return filesystem.copy_file(record.local_path, dest.string());
      }
      if (filesystem.rename(record.local_path, dest.string())) {
        return true;
      }
      // rename() fails across filesystems
      return filesystem.copy_file(record.local_path, dest.string()) &&
             filesystem.remove(record.local_path);
    }
  }
  return false;
}

MirrorUploadOperation::MirrorUploadOperation(
  const UploadRecord& record, const MirrorConfig& config, size_t chunk_size,
  std::shared_ptr<IFileSystem> filesystem
)
    : record_(record)
    , config_(config)
    , chunk_size_(std::max<size_t>(chunk_size, 1))
    , filesystem_(std::move(filesystem)) {}

void MirrorUploadOperation::setProgressListener(ProgressListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

void MirrorUploadOperation::reportProgress(uint64_t transferred, uint64_t total) {
  ProgressListener listener;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(transferred, total);
  }
}

ResultCode MirrorUploadOperation::execute(RemoteClient& client) {
  uploaded_path_.clear();

  if (cancelled_) {
    return ResultCode::CANCELLED;
  }
  if (client.account_name != record_.account_name) {
    CIRRUS_LOG_WARN(
      "Client belongs to another account" << kv("upload_id", record_.id)
                                          << kv("client_account", client.account_name)
    );
    return ResultCode::ACCOUNT_NOT_THE_SAME;
  }
  if (!isValidRemotePath(record_.remote_path)) {
    return ResultCode::INVALID_CHARACTER_IN_NAME;
  }
  if (!filesystem_->is_regular_file(record_.local_path)) {
    return ResultCode::LOCAL_FILE_NOT_FOUND;
  }
  if (client.endpoint.empty() || !filesystem_->exists(config_.remote_root)) {
    CIRRUS_LOG_WARN("Remote root is not mounted" << kv("remote_root", config_.remote_root));
    return ResultCode::HOST_NOT_AVAILABLE;
  }

  std::string target =
    (fs::path(client.endpoint) / stripLeadingSlashes(record_.remote_path)).string();
  uint64_t file_size = filesystem_->file_size(record_.local_path);
  uint64_t replaced_bytes = 0;

  if (filesystem_->exists(target)) {
    switch (record_.name_collision_policy) {
      case NameCollisionPolicy::SKIP:
        return ResultCode::SKIPPED_EXISTING;
      case NameCollisionPolicy::ASK_USER:
        return ResultCode::SYNC_CONFLICT;
      case NameCollisionPolicy::OVERWRITE:
        replaced_bytes = filesystem_->file_size(target);
        break;
      case NameCollisionPolicy::RENAME:
      case NameCollisionPolicy::DEFAULT:
        target = resolveCollisionNameImpl(target, *filesystem_);
        break;
    }
  }

  if (config_.quota_bytes > 0) {
    uint64_t used = filesystem_->directory_size(client.endpoint);
    uint64_t after = used - std::min(used, replaced_bytes) + file_size;
    if (after > config_.quota_bytes) {
      CIRRUS_LOG_WARN(
        "Quota exceeded" << kv("upload_id", record_.id) << kv("used", used)
                         << kv("file_size", file_size) << kv("quota", config_.quota_bytes)
      );
      return ResultCode::QUOTA_EXCEEDED;
    }
  }

  if (!filesystem_->create_directories(fs::path(target).parent_path().string())) {
    return ResultCode::SERVICE_UNAVAILABLE;
  }

  ResultCode code = copyChunked(target, file_size);
  if (code != ResultCode::OK) {
    return code;
  }

  uploaded_path_ = target;

  if (!applyLocalBehaviourImpl(record_, config_.local_storage_root, *filesystem_)) {
    CIRRUS_LOG_WARN(
      "Uploaded but local file handling failed" << kv("upload_id", record_.id)
                                                << kv("behaviour",
                                                      localBehaviourToString(record_.local_behaviour))
    );
  }

  return ResultCode::OK;
}

ResultCode MirrorUploadOperation::copyChunked(const std::string& target, uint64_t total_bytes) {
  std::string part_path = target + ".part";

  std::ifstream in(record_.local_path, std::ios::binary);
  if (!in) {
    return ResultCode::LOCAL_FILE_NOT_FOUND;
  }
  std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return ResultCode::SERVICE_UNAVAILABLE;
  }

  std::vector<char> buffer(chunk_size_);
  uint64_t transferred = 0;
  reportProgress(0, total_bytes);

  while (true) {
    if (cancelled_) {
      out.close();
      filesystem_->remove(part_path);
      CIRRUS_LOG_INFO("Upload cancelled" << kv("upload_id", record_.id) << kv("bytes", transferred));
      return ResultCode::CANCELLED;
    }

    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize count = in.gcount();
    if (count > 0) {
      out.write(buffer.data(), count);
      if (!out) {
        out.close();
        filesystem_->remove(part_path);
        return ResultCode::SERVICE_UNAVAILABLE;
      }
      transferred += static_cast<uint64_t>(count);
      reportProgress(transferred, total_bytes);
    }

    if (!in) {
      if (in.eof()) {
        break;
      }
      out.close();
      filesystem_->remove(part_path);
      return ResultCode::UNKNOWN_ERROR;
    }
  }

  out.close();
  if (out.fail()) {
    filesystem_->remove(part_path);
    return ResultCode::SERVICE_UNAVAILABLE;
  }

  if (!filesystem_->rename(part_path, target)) {
    filesystem_->remove(part_path);
    return ResultCode::UNKNOWN_ERROR;
  }
  return ResultCode::OK;
}

MirrorOperationFactory::MirrorOperationFactory(
  const MirrorConfig& config, std::shared_ptr<IFileSystem> filesystem
)
    : config_(config)
    , filesystem_(std::move(filesystem)) {}

std::shared_ptr<IUploadOperation> MirrorOperationFactory::create(
  const UploadRecord& record, const User& /*user*/, const OperationContext& context
) {
  if (record.local_path.empty()) {
    return nullptr;
  }

  size_t chunk_size = config_.chunk_size;
  if (context.power_save_mode && !context.battery_charging) {
    chunk_size = config_.power_save_chunk_size;
  }

  return std::make_shared<MirrorUploadOperation>(record, config_, chunk_size, filesystem_);
}

MirrorClientFactory::MirrorClientFactory(const MirrorConfig& config)
    : config_(config) {}

std::shared_ptr<RemoteClient> MirrorClientFactory::create(const User& user) {
  if (config_.remote_root.empty() ||
      user.account_name.find_first_not_of(" \t\r\n") == std::string::npos) {
    return nullptr;
  }

  auto client = std::make_shared<RemoteClient>();
  client->account_name = user.account_name;
  client->endpoint = (fs::path(config_.remote_root) / user.account_name).string();
  return client;
}

}  // namespace uploader
}  // namespace cirrus
