// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_APP_PREFERENCES_HPP
#define CIRRUS_APP_PREFERENCES_HPP

#include <memory>
#include <optional>
#include <string>

#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

constexpr const char* kPrefGlobalUploadPaused = "global_upload_paused";

/**
 * Key/value preferences persisted in a SQLite table.
 *
 * May share its database file with SqliteUploadStore. Values written by
 * one process (the CLI pause command) are seen by another on the next read.
 */
class SqlitePreferences : public IPreferences {
public:
  /**
   * @throws std::runtime_error if the database cannot be opened or initialized
   */
  explicit SqlitePreferences(const std::string& db_path);
  ~SqlitePreferences() override;

  SqlitePreferences(const SqlitePreferences&) = delete;
  SqlitePreferences& operator=(const SqlitePreferences&) = delete;

  bool isGlobalUploadPaused() const override;
  void setGlobalUploadPaused(bool paused) override;

  std::optional<std::string> getString(const std::string& key) const;

  /**
   * @return false on a storage error
   */
  bool setString(const std::string& key, const std::string& value);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_APP_PREFERENCES_HPP
