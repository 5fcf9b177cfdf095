// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOADER_APP_CONFIG_HPP
#define CIRRUS_UPLOADER_APP_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "upload_record.hpp"

namespace cirrus {
namespace app {

/**
 * Scheduler retry backoff, as written in the YAML file
 */
struct RetrySection {
  int max_retries = 10;
  int initial_delay_ms = 30000;
  int max_delay_ms = 18000000;
  double exponential_base = 2.0;
  bool jitter = true;
};

struct UploaderSection {
  std::string db_path = "/var/lib/cirrus/uploads.db";
  int num_workers = 2;
  size_t batch_size = 100;
  int poll_interval_ms = 200;
  RetrySection retry;
};

/**
 * Mounted remote tree the mirror transfer writes into
 */
struct RemoteSection {
  std::string root;
  std::string local_storage_root = "/var/lib/cirrus/files";
  uint64_t quota_mb = 0;  // 0 = unlimited
  size_t chunk_size_kb = 1024;
  size_t power_save_chunk_size_kb = 64;
};

/**
 * Where connectivity and power state are read from
 */
struct SystemSection {
  std::string net_class_path = "/sys/class/net";
  std::string power_supply_path = "/sys/class/power_supply";
  std::string platform_profile_path = "/sys/firmware/acpi/platform_profile";
};

struct LoggingSection {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";  // debug, info, warn, error

  // File sink
  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/cirrus";
  std::string file_pattern = "uploader_%Y%m%d_%H%M%S.log";
  std::string file_format = "text";  // json or text
  size_t rotation_size_mb = 50;
  size_t max_files = 10;
  bool rotate_at_midnight = true;
};

/**
 * Complete cirrus_uploader configuration
 */
struct AppConfig {
  UploaderSection uploader;
  RemoteSection remote;
  SystemSection system;
  std::vector<uploader::User> accounts;
  LoggingSection logging;
};

}  // namespace app
}  // namespace cirrus

#endif  // CIRRUS_UPLOADER_APP_CONFIG_HPP
