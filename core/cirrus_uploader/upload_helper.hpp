// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOAD_HELPER_HPP
#define CIRRUS_UPLOAD_HELPER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * Entry point for queueing new uploads.
 *
 * Persists one record per file and hands the new ids to the scheduler,
 * which splits them into worker batches.
 */
class UploadHelper {
public:
  UploadHelper(IUploadStore& store, IUploadJobScheduler& scheduler, const IFileSystem& filesystem);

  /**
   * Queue local files for upload into the user's account
   *
   * local_paths[i] is uploaded to remote_paths[i].
   *
   * @return Ids of the persisted records, empty if the path lists differ in
   *         length or nothing could be stored
   */
  std::vector<int64_t> uploadNewFiles(
    const User& user, const std::vector<std::string>& local_paths,
    const std::vector<std::string>& remote_paths, LocalBehaviour local_behaviour,
    CreatedBy created_by, NameCollisionPolicy name_collision_policy
  );

  /**
   * Reset the account's FAILED uploads to PENDING and schedule them again
   *
   * @return Number of uploads re-queued
   */
  size_t retryFailedUploads(const std::string& account_name);

private:
  IUploadStore& store_;
  IUploadJobScheduler& scheduler_;
  const IFileSystem& filesystem_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_UPLOAD_HELPER_HPP
