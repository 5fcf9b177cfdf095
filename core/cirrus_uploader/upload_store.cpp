// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_store.hpp"

#include <sqlite3.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

#define CIRRUS_LOG_COMPONENT "upload_store"
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace uploader {

// Get current ISO 8601 timestamp
static std::string currentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&time, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

static std::string columnText(sqlite3_stmt* stmt, int column) {
  const unsigned char* text = sqlite3_column_text(stmt, column);
  return text ? reinterpret_cast<const char*>(text) : "";
}

static const char* kSelectColumns =
  "SELECT id, account_name, local_path, remote_path, local_behaviour, created_by, "
  "name_collision_policy, status, last_result, file_size_bytes, created_at, updated_at, "
  "uploaded_at FROM uploads";

class SqliteUploadStore::Impl {
public:
  sqlite3* db = nullptr;
  std::string db_path;
  mutable std::mutex mutex;

  ~Impl() {
    if (db) {
      sqlite3_close(db);
    }
  }

  void initDatabase() {
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
      throw std::runtime_error("Cannot open SQLite database: " + db_path);
    }

    char* err_msg = nullptr;
    rc = sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
      std::string error = err_msg ? err_msg : "Unknown error";
      sqlite3_free(err_msg);
      throw std::runtime_error("Failed to enable WAL mode: " + error);
    }

    rc = sqlite3_exec(db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
      sqlite3_free(err_msg);
    }

    rc = sqlite3_exec(db, "PRAGMA busy_timeout=5000;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
      sqlite3_free(err_msg);
    }

    const char* create_sql = R"(
      CREATE TABLE IF NOT EXISTS uploads (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        account_name TEXT NOT NULL,
        local_path TEXT NOT NULL,
        remote_path TEXT NOT NULL,
        local_behaviour TEXT NOT NULL,
        created_by TEXT NOT NULL,
        name_collision_policy TEXT NOT NULL,
        status TEXT NOT NULL CHECK(status IN ('pending', 'in_progress', 'done', 'failed')),
        last_result TEXT NOT NULL,
        file_size_bytes INTEGER DEFAULT 0,
        created_at TEXT NOT NULL,
        updated_at TEXT NOT NULL,
        uploaded_at TEXT
      );
      CREATE INDEX IF NOT EXISTS idx_uploads_account ON uploads(account_name);
      CREATE INDEX IF NOT EXISTS idx_uploads_status ON uploads(status);
    )";

    rc = sqlite3_exec(db, create_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
      std::string error = err_msg ? err_msg : "Unknown error";
      sqlite3_free(err_msg);
      throw std::runtime_error("Failed to create tables: " + error);
    }
  }

  static UploadRecord parseRecord(sqlite3_stmt* stmt) {
    UploadRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.account_name = columnText(stmt, 1);
    record.local_path = columnText(stmt, 2);
    record.remote_path = columnText(stmt, 3);
    record.local_behaviour = localBehaviourFromString(columnText(stmt, 4));
    record.created_by = createdByFromString(columnText(stmt, 5));
    record.name_collision_policy = nameCollisionPolicyFromString(columnText(stmt, 6));
    record.status = uploadStatusFromString(columnText(stmt, 7));
    record.last_result = resultCodeFromString(columnText(stmt, 8));
    record.file_size_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 9));
    record.created_at = columnText(stmt, 10);
    record.updated_at = columnText(stmt, 11);
    record.uploaded_at = columnText(stmt, 12);
    return record;
  }

  // Run a prepared SELECT and collect every row. Caller holds the mutex.
  std::vector<UploadRecord> queryRecords(sqlite3_stmt* stmt) const {
    std::vector<UploadRecord> records;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
      records.push_back(parseRecord(stmt));
    }
    if (rc != SQLITE_DONE) {
      CIRRUS_LOG_ERROR("Upload query failed: " << sqlite3_errmsg(db));
    }
    sqlite3_finalize(stmt);
    return records;
  }

  sqlite3_stmt* prepare(const std::string& sql) const {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
      CIRRUS_LOG_ERROR("Failed to prepare statement: " << sqlite3_errmsg(db));
      return nullptr;
    }
    return stmt;
  }
};

SqliteUploadStore::SqliteUploadStore(const std::string& db_path)
    : impl_(std::make_unique<Impl>()) {
  impl_->db_path = db_path;
  impl_->initDatabase();
}

SqliteUploadStore::~SqliteUploadStore() = default;

std::optional<int64_t> SqliteUploadStore::insertUpload(const UploadRecord& record) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  const char* sql = R"(
    INSERT INTO uploads
    (account_name, local_path, remote_path, local_behaviour, created_by, name_collision_policy,
     status, last_result, file_size_bytes, created_at, updated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
  )";

  sqlite3_stmt* stmt = impl_->prepare(sql);
  if (!stmt) {
    return std::nullopt;
  }

  std::string now = currentTimestamp();
  sqlite3_bind_text(stmt, 1, record.account_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, record.local_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, record.remote_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(
    stmt, 4, localBehaviourToString(record.local_behaviour).c_str(), -1, SQLITE_TRANSIENT
  );
  sqlite3_bind_text(stmt, 5, createdByToString(record.created_by).c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(
    stmt, 6, nameCollisionPolicyToString(record.name_collision_policy).c_str(), -1,
    SQLITE_TRANSIENT
  );
  sqlite3_bind_text(stmt, 7, uploadStatusToString(record.status).c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 8, resultCodeToString(record.last_result).c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(record.file_size_bytes));
  sqlite3_bind_text(stmt, 10, now.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 11, now.c_str(), -1, SQLITE_TRANSIENT);

  int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);

  if (rc != SQLITE_DONE) {
    CIRRUS_LOG_ERROR("Failed to insert upload: " << sqlite3_errmsg(impl_->db));
    return std::nullopt;
  }
  return static_cast<int64_t>(sqlite3_last_insert_rowid(impl_->db));
}

std::optional<UploadRecord> SqliteUploadStore::getUpload(int64_t id) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  sqlite3_stmt* stmt = impl_->prepare(std::string(kSelectColumns) + " WHERE id = ?");
  if (!stmt) {
    return std::nullopt;
  }
  sqlite3_bind_int64(stmt, 1, id);

  auto records = impl_->queryRecords(stmt);
  if (records.empty()) {
    return std::nullopt;
  }
  return records.front();
}

std::vector<UploadRecord> SqliteUploadStore::getUploadsByIds(
  const std::vector<int64_t>& ids, const std::string& account_name
) const {
  if (ids.empty()) {
    return {};
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);

  std::ostringstream sql;
  sql << kSelectColumns << " WHERE account_name = ? AND id IN (";
  for (size_t i = 0; i < ids.size(); ++i) {
    sql << (i == 0 ? "?" : ", ?");
  }
  sql << ") ORDER BY id";

  sqlite3_stmt* stmt = impl_->prepare(sql.str());
  if (!stmt) {
    return {};
  }

  sqlite3_bind_text(stmt, 1, account_name.c_str(), -1, SQLITE_TRANSIENT);
  for (size_t i = 0; i < ids.size(); ++i) {
    sqlite3_bind_int64(stmt, static_cast<int>(i) + 2, ids[i]);
  }

  return impl_->queryRecords(stmt);
}

std::vector<UploadRecord> SqliteUploadStore::getPendingUploads() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  sqlite3_stmt* stmt = impl_->prepare(
    std::string(kSelectColumns) + " WHERE status IN ('pending', 'in_progress') ORDER BY id"
  );
  if (!stmt) {
    return {};
  }
  return impl_->queryRecords(stmt);
}

bool SqliteUploadStore::updateUploadStatus(
  int64_t id, UploadStatus status, ResultCode last_result
) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  const char* sql = R"(
    UPDATE uploads
    SET status = ?, last_result = ?, updated_at = ?,
        uploaded_at = CASE WHEN ? = 'done' THEN ? ELSE uploaded_at END
    WHERE id = ?
  )";

  sqlite3_stmt* stmt = impl_->prepare(sql);
  if (!stmt) {
    return false;
  }

  std::string now = currentTimestamp();
  std::string status_str = uploadStatusToString(status);
  sqlite3_bind_text(stmt, 1, status_str.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, resultCodeToString(last_result).c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, now.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, status_str.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, now.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 6, id);

  int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);

  return rc == SQLITE_DONE && sqlite3_changes(impl_->db) > 0;
}

bool SqliteUploadStore::removeUpload(int64_t id) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  sqlite3_stmt* stmt = impl_->prepare("DELETE FROM uploads WHERE id = ?");
  if (!stmt) {
    return false;
  }
  sqlite3_bind_int64(stmt, 1, id);

  int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);

  return rc == SQLITE_DONE && sqlite3_changes(impl_->db) > 0;
}

std::vector<UploadRecord> SqliteUploadStore::getUploadsForAccount(
  const std::string& account_name
) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  sqlite3_stmt* stmt =
    impl_->prepare(std::string(kSelectColumns) + " WHERE account_name = ? ORDER BY id");
  if (!stmt) {
    return {};
  }
  sqlite3_bind_text(stmt, 1, account_name.c_str(), -1, SQLITE_TRANSIENT);
  return impl_->queryRecords(stmt);
}

std::vector<UploadRecord> SqliteUploadStore::getPendingUploadsForAccount(
  const std::string& account_name
) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  sqlite3_stmt* stmt = impl_->prepare(
    std::string(kSelectColumns) +
    " WHERE account_name = ? AND status IN ('pending', 'in_progress') ORDER BY id"
  );
  if (!stmt) {
    return {};
  }
  sqlite3_bind_text(stmt, 1, account_name.c_str(), -1, SQLITE_TRANSIENT);
  return impl_->queryRecords(stmt);
}

size_t SqliteUploadStore::countByStatus(UploadStatus status) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  sqlite3_stmt* stmt = impl_->prepare("SELECT COUNT(*) FROM uploads WHERE status = ?");
  if (!stmt) {
    return 0;
  }

  sqlite3_bind_text(stmt, 1, uploadStatusToString(status).c_str(), -1, SQLITE_TRANSIENT);

  size_t count = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
  }

  sqlite3_finalize(stmt);
  return count;
}

int SqliteUploadStore::deleteFinished() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  char* err_msg = nullptr;
  int rc =
    sqlite3_exec(impl_->db, "DELETE FROM uploads WHERE status = 'done'", nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    CIRRUS_LOG_ERROR("Failed to delete finished uploads: " << (err_msg ? err_msg : "unknown"));
    sqlite3_free(err_msg);
    return 0;
  }

  return sqlite3_changes(impl_->db);
}

const std::string& SqliteUploadStore::dbPath() const {
  return impl_->db_path;
}

}  // namespace uploader
}  // namespace cirrus
