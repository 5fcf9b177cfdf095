// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "app_preferences.hpp"

#include <sqlite3.h>

#include <mutex>
#include <stdexcept>

#define CIRRUS_LOG_COMPONENT "preferences"
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace uploader {

class SqlitePreferences::Impl {
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
    rc = sqlite3_exec(db, "PRAGMA busy_timeout=5000;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
      sqlite3_free(err_msg);
    }

    const char* create_sql = R"(
      CREATE TABLE IF NOT EXISTS preferences (
        key TEXT PRIMARY KEY,
        value TEXT NOT NULL
      );
    )";

    rc = sqlite3_exec(db, create_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
      std::string error = err_msg ? err_msg : "Unknown error";
      sqlite3_free(err_msg);
      throw std::runtime_error("Failed to create preferences table: " + error);
    }
  }
};

SqlitePreferences::SqlitePreferences(const std::string& db_path)
    : impl_(std::make_unique<Impl>()) {
  impl_->db_path = db_path;
  impl_->initDatabase();
}

SqlitePreferences::~SqlitePreferences() = default;

bool SqlitePreferences::isGlobalUploadPaused() const {
  auto value = getString(kPrefGlobalUploadPaused);
  return value && *value == "true";
}

void SqlitePreferences::setGlobalUploadPaused(bool paused) {
  if (!setString(kPrefGlobalUploadPaused, paused ? "true" : "false")) {
    CIRRUS_LOG_ERROR("Failed to store global upload pause flag");
  }
}

std::optional<std::string> SqlitePreferences::getString(const std::string& key) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  sqlite3_stmt* stmt = nullptr;
  int rc =
    sqlite3_prepare_v2(impl_->db, "SELECT value FROM preferences WHERE key = ?", -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return std::nullopt;
  }

  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<std::string> value;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    const unsigned char* text = sqlite3_column_text(stmt, 0);
    value = text ? reinterpret_cast<const char*>(text) : "";
  }

  sqlite3_finalize(stmt);
  return value;
}

bool SqlitePreferences::setString(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  const char* sql = R"(
    INSERT INTO preferences (key, value) VALUES (?, ?)
    ON CONFLICT(key) DO UPDATE SET value = excluded.value
  )";

  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return false;
  }

  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);

  rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);

  return rc == SQLITE_DONE;
}

}  // namespace uploader
}  // namespace cirrus
