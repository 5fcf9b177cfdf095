// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOAD_STORE_HPP
#define CIRRUS_UPLOAD_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * SQLite-backed upload record store
 *
 * Persists every queued upload so that work survives process restarts.
 * Uses WAL mode for crash safety and concurrent reads from several workers.
 *
 * Schema:
 *   CREATE TABLE uploads (
 *     id INTEGER PRIMARY KEY AUTOINCREMENT,
 *     account_name TEXT NOT NULL,
 *     local_path TEXT NOT NULL,
 *     remote_path TEXT NOT NULL,
 *     local_behaviour TEXT NOT NULL,
 *     created_by TEXT NOT NULL,
 *     name_collision_policy TEXT NOT NULL,
 *     status TEXT NOT NULL,  -- pending, in_progress, done, failed
 *     last_result TEXT NOT NULL,
 *     file_size_bytes INTEGER,
 *     created_at TEXT NOT NULL,
 *     updated_at TEXT NOT NULL,
 *     uploaded_at TEXT
 *   );
 */
class SqliteUploadStore : public IUploadStore {
public:
  /**
   * Open or create the store
   *
   * @param db_path Path to SQLite database file
   * @throws std::runtime_error if the database cannot be opened or initialized
   */
  explicit SqliteUploadStore(const std::string& db_path);
  ~SqliteUploadStore() override;

  // Non-copyable, non-movable
  SqliteUploadStore(const SqliteUploadStore&) = delete;
  SqliteUploadStore& operator=(const SqliteUploadStore&) = delete;
  SqliteUploadStore(SqliteUploadStore&&) = delete;
  SqliteUploadStore& operator=(SqliteUploadStore&&) = delete;

  std::optional<int64_t> insertUpload(const UploadRecord& record) override;

  std::optional<UploadRecord> getUpload(int64_t id) const override;

  std::vector<UploadRecord> getUploadsByIds(
    const std::vector<int64_t>& ids, const std::string& account_name
  ) const override;

  std::vector<UploadRecord> getPendingUploads() const override;

  bool updateUploadStatus(int64_t id, UploadStatus status, ResultCode last_result) override;

  bool removeUpload(int64_t id) override;

  std::vector<UploadRecord> getUploadsForAccount(const std::string& account_name) const override;

  /**
   * PENDING and IN_PROGRESS records of one account, ordered by id
   */
  std::vector<UploadRecord> getPendingUploadsForAccount(const std::string& account_name) const;

  size_t countByStatus(UploadStatus status) const;

  /**
   * Delete DONE records
   *
   * @return Number of records deleted
   */
  int deleteFinished();

  const std::string& dbPath() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_UPLOAD_STORE_HPP
