// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_MIRROR_TRANSFER_HPP
#define CIRRUS_MIRROR_TRANSFER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * Configuration for uploads into a mounted remote directory tree
 */
struct MirrorConfig {
  // Each account owns <remote_root>/<account_name>
  std::string remote_root;

  // Files kept after a COPY or MOVE upload land in <local_storage_root>/<account_name>
  std::string local_storage_root;

  // Per-account quota in bytes (0 = unlimited)
  uint64_t quota_bytes = 0;

  size_t chunk_size = 1024 * 1024;
  size_t power_save_chunk_size = 64 * 1024;  // Used on battery in power-saving mode
};

/**
 * Check a remote path for names the remote side rejects.
 *
 * Rejects empty paths, "." and ".." segments, control characters and
 * any of \ : * ? " < > |
 */
bool isValidRemotePath(const std::string& remote_path);

/**
 * First free name of the form "name (N).ext" next to target, N >= 2
 */
std::string resolveCollisionNameImpl(const std::string& target, const IFileSystem& filesystem);

/**
 * Apply the local behaviour of a finished upload to its source file
 *
 * @return false if the file could not be copied, moved or deleted
 */
bool applyLocalBehaviourImpl(
  const UploadRecord& record, const std::string& local_storage_root, const IFileSystem& filesystem
);

/**
 * Uploads one file into the account directory of a mirror client.
 *
 * The file is written to "<target>.part" chunk by chunk and renamed into
 * place when complete, so a cancelled or failed transfer never leaves a
 * partial file under the final name.
 */
class MirrorUploadOperation : public IUploadOperation {
public:
  MirrorUploadOperation(
    const UploadRecord& record, const MirrorConfig& config, size_t chunk_size,
    std::shared_ptr<IFileSystem> filesystem
  );

  ResultCode execute(RemoteClient& client) override;

  void cancel() override {
    cancelled_ = true;
  }

  bool isCancelled() const override {
    return cancelled_.load();
  }

  void setProgressListener(ProgressListener listener) override;

  size_t chunkSize() const {
    return chunk_size_;
  }

  /**
   * Final remote location of the last execute() call, empty if none
   */
  const std::string& uploadedPath() const {
    return uploaded_path_;
  }

private:
  ResultCode copyChunked(const std::string& target, uint64_t total_bytes);
  void reportProgress(uint64_t transferred, uint64_t total);

  UploadRecord record_;
  MirrorConfig config_;
  size_t chunk_size_;
  std::shared_ptr<IFileSystem> filesystem_;
  std::atomic<bool> cancelled_{false};
  std::mutex listener_mutex_;
  ProgressListener listener_;
  std::string uploaded_path_;
};

/**
 * Builds MirrorUploadOperation instances for the worker
 */
class MirrorOperationFactory : public IUploadOperationFactory {
public:
  MirrorOperationFactory(const MirrorConfig& config, std::shared_ptr<IFileSystem> filesystem);

  std::shared_ptr<IUploadOperation> create(
    const UploadRecord& record, const User& user, const OperationContext& context
  ) override;

private:
  MirrorConfig config_;
  std::shared_ptr<IFileSystem> filesystem_;
};

/**
 * Hands out clients whose endpoint is the account directory below the
 * remote root
 */
class MirrorClientFactory : public IClientFactory {
public:
  explicit MirrorClientFactory(const MirrorConfig& config);

  /**
   * @return nullptr if no remote root is configured or the account name is blank
   */
  std::shared_ptr<RemoteClient> create(const User& user) override;

private:
  MirrorConfig config_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_MIRROR_TRANSFER_HPP
