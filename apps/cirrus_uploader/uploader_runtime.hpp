// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOADER_RUNTIME_HPP
#define CIRRUS_UPLOADER_RUNTIME_HPP

#include <memory>

#include "account_manager.hpp"
#include "active_operation_registry.hpp"
#include "app_preferences.hpp"
#include "event_broadcaster.hpp"
#include "file_upload_job.hpp"
#include "mirror_transfer.hpp"
#include "system_services.hpp"
#include "upload_helper.hpp"
#include "upload_notifier.hpp"
#include "upload_scheduler.hpp"
#include "upload_store.hpp"
#include "uploader_config.hpp"
#include "uploader_impl.hpp"

namespace cirrus {
namespace app {

/**
 * Owns every uploader service built from one AppConfig.
 *
 * Members are declared in dependency order, so the scheduler is destroyed
 * (and its threads joined) before the services its jobs use.
 *
 * @throws std::runtime_error from the constructor if the database cannot be opened
 */
class UploaderRuntime {
public:
  explicit UploaderRuntime(const AppConfig& config);
  ~UploaderRuntime();

  UploaderRuntime(const UploaderRuntime&) = delete;
  UploaderRuntime& operator=(const UploaderRuntime&) = delete;

  uploader::SqliteUploadStore& store() {
    return *store_;
  }
  uploader::SqlitePreferences& preferences() {
    return *preferences_;
  }
  uploader::StaticAccountManager& accounts() {
    return accounts_;
  }
  uploader::EventBroadcaster& broadcaster() {
    return broadcaster_;
  }
  uploader::LoggingUploadNotifier& notifier() {
    return notifier_;
  }
  uploader::UploadScheduler& scheduler() {
    return *scheduler_;
  }
  uploader::UploadHelper& helper() {
    return *helper_;
  }
  const uploader::IFileSystem& filesystem() const {
    return *filesystem_;
  }

private:
  std::unique_ptr<uploader::SqliteUploadStore> store_;
  std::unique_ptr<uploader::SqlitePreferences> preferences_;
  uploader::StaticAccountManager accounts_;
  SysfsConnectivityService connectivity_;
  SysfsPowerManagementService power_;
  std::shared_ptr<uploader::FileSystemImpl> filesystem_;
  uploader::MirrorOperationFactory operation_factory_;
  uploader::MirrorClientFactory client_factory_;
  uploader::LoggingUploadNotifier notifier_;
  uploader::EventBroadcaster broadcaster_;
  uploader::ActiveOperationRegistry registry_;
  std::unique_ptr<uploader::FileUploadJob> job_;
  std::unique_ptr<uploader::UploadScheduler> scheduler_;
  std::unique_ptr<uploader::UploadHelper> helper_;
};

}  // namespace app
}  // namespace cirrus

#endif  // CIRRUS_UPLOADER_RUNTIME_HPP
