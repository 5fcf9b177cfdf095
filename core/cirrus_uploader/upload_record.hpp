// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOAD_RECORD_HPP
#define CIRRUS_UPLOAD_RECORD_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "result_code.hpp"

namespace cirrus {
namespace uploader {

/**
 * Upload status enumeration
 */
enum class UploadStatus {
  PENDING,      // Queued, waiting for a worker
  IN_PROGRESS,  // Owned by a running worker
  DONE,         // Uploaded
  FAILED        // Will not be retried (fatal or cancelled)
};

/**
 * What happens to the local file once it is uploaded
 */
enum class LocalBehaviour {
  COPY,    // Keep a copy in local account storage
  MOVE,    // Move into local account storage
  FORGET,  // Leave the local file alone
  DELETE   // Remove the local file
};

enum class CreatedBy { USER, INSTANT_UPLOAD, AUTO_UPLOAD };

/**
 * What to do when the remote path already exists
 */
enum class NameCollisionPolicy {
  DEFAULT,  // Same as RENAME
  OVERWRITE,
  RENAME,
  SKIP,
  ASK_USER  // Cannot be resolved in the background; reported as SYNC_CONFLICT
};

inline std::string uploadStatusToString(UploadStatus status) {
  switch (status) {
    case UploadStatus::PENDING:
      return "pending";
    case UploadStatus::IN_PROGRESS:
      return "in_progress";
    case UploadStatus::DONE:
      return "done";
    case UploadStatus::FAILED:
      return "failed";
    default:
      return "unknown";
  }
}

inline UploadStatus uploadStatusFromString(const std::string& str) {
  if (str == "in_progress") return UploadStatus::IN_PROGRESS;
  if (str == "done") return UploadStatus::DONE;
  if (str == "failed") return UploadStatus::FAILED;
  return UploadStatus::PENDING;
}

inline std::string localBehaviourToString(LocalBehaviour behaviour) {
  switch (behaviour) {
    case LocalBehaviour::COPY:
      return "copy";
    case LocalBehaviour::MOVE:
      return "move";
    case LocalBehaviour::FORGET:
      return "forget";
    case LocalBehaviour::DELETE:
      return "delete";
    default:
      return "forget";
  }
}

inline LocalBehaviour localBehaviourFromString(const std::string& str) {
  if (str == "copy") return LocalBehaviour::COPY;
  if (str == "move") return LocalBehaviour::MOVE;
  if (str == "delete") return LocalBehaviour::DELETE;
  return LocalBehaviour::FORGET;
}

inline std::string createdByToString(CreatedBy created_by) {
  switch (created_by) {
    case CreatedBy::USER:
      return "user";
    case CreatedBy::INSTANT_UPLOAD:
      return "instant_upload";
    case CreatedBy::AUTO_UPLOAD:
      return "auto_upload";
    default:
      return "user";
  }
}

inline CreatedBy createdByFromString(const std::string& str) {
  if (str == "instant_upload") return CreatedBy::INSTANT_UPLOAD;
  if (str == "auto_upload") return CreatedBy::AUTO_UPLOAD;
  return CreatedBy::USER;
}

inline std::string nameCollisionPolicyToString(NameCollisionPolicy policy) {
  switch (policy) {
    case NameCollisionPolicy::DEFAULT:
      return "default";
    case NameCollisionPolicy::OVERWRITE:
      return "overwrite";
    case NameCollisionPolicy::RENAME:
      return "rename";
    case NameCollisionPolicy::SKIP:
      return "skip";
    case NameCollisionPolicy::ASK_USER:
      return "ask_user";
    default:
      return "default";
  }
}

inline NameCollisionPolicy nameCollisionPolicyFromString(const std::string& str) {
  if (str == "overwrite") return NameCollisionPolicy::OVERWRITE;
  if (str == "rename") return NameCollisionPolicy::RENAME;
  if (str == "skip") return NameCollisionPolicy::SKIP;
  if (str == "ask_user") return NameCollisionPolicy::ASK_USER;
  return NameCollisionPolicy::DEFAULT;
}

/**
 * One queued file transfer as persisted by the upload store
 */
struct UploadRecord {
  int64_t id;                  // Primary key, assigned by the store
  std::string account_name;    // Owning account
  std::string local_path;      // Source file on this machine
  std::string remote_path;     // Destination path below the account root
  LocalBehaviour local_behaviour;
  CreatedBy created_by;
  NameCollisionPolicy name_collision_policy;
  UploadStatus status;
  ResultCode last_result;      // Result of the most recent attempt
  uint64_t file_size_bytes;
  std::string created_at;      // ISO 8601
  std::string updated_at;      // ISO 8601
  std::string uploaded_at;     // ISO 8601, empty until DONE

  UploadRecord()
      : id(0)
      , local_behaviour(LocalBehaviour::FORGET)
      , created_by(CreatedBy::USER)
      , name_collision_policy(NameCollisionPolicy::DEFAULT)
      , status(UploadStatus::PENDING)
      , last_result(ResultCode::OK)
      , file_size_bytes(0) {}
};

/**
 * An authenticated account as seen by the worker
 */
struct User {
  std::string account_name;
  std::string display_name;
};

struct AccountFound {
  User user;
};

struct AccountNotFound {
  std::string account_name;
};

/**
 * Result of resolving an account name
 */
using AccountLookup = std::variant<AccountFound, AccountNotFound>;

/**
 * Parameters of a single worker invocation
 */
struct BatchInput {
  std::string account_name;
  std::vector<int64_t> upload_ids;
  int current_batch_index = 0;
  int total_batches = 1;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_UPLOAD_RECORD_HPP
