// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "uploader_runtime.hpp"

#include "config_parser.hpp"

#define CIRRUS_LOG_COMPONENT "runtime"
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace app {

using cirrus::logging::kv;

UploaderRuntime::UploaderRuntime(const AppConfig& config)
    : store_(std::make_unique<uploader::SqliteUploadStore>(config.uploader.db_path))
    , preferences_(std::make_unique<uploader::SqlitePreferences>(config.uploader.db_path))
    , accounts_(config.accounts)
    , connectivity_(config.system.net_class_path)
    , power_(config.system.power_supply_path, config.system.platform_profile_path)
    , filesystem_(std::make_shared<uploader::FileSystemImpl>())
    , operation_factory_(to_mirror_config(config.remote), filesystem_)
    , client_factory_(to_mirror_config(config.remote)) {
  uploader::WorkerCollaborators collaborators{
    accounts_,         *store_,         *preferences_, connectivity_, power_,
    operation_factory_, client_factory_, notifier_,     broadcaster_
  };
  job_ = std::make_unique<uploader::FileUploadJob>(collaborators, registry_);
  scheduler_ = std::make_unique<uploader::UploadScheduler>(
    to_scheduler_config(config.uploader), *store_, registry_, *job_
  );
  helper_ = std::make_unique<uploader::UploadHelper>(*store_, *scheduler_, *filesystem_);

  CIRRUS_LOG_DEBUG(
    "Uploader runtime ready" << kv("db_path", config.uploader.db_path)
                             << kv("accounts", config.accounts.size())
  );
}

UploaderRuntime::~UploaderRuntime() {
  if (scheduler_ && scheduler_->isRunning()) {
    scheduler_->stop();
  }
}

}  // namespace app
}  // namespace cirrus
