// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <fstream>
#include <set>

#include "mirror_transfer.hpp"
#include "upload_scheduler.hpp"

// Logging infrastructure
#define CIRRUS_LOG_COMPONENT "config_parser"
#include <cirrus_log_init.hpp>
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace app {

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, AppConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, AppConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["uploader"]) {
      if (!parse_uploader(node["uploader"], config.uploader)) {
        return false;
      }
    }

    if (node["remote"]) {
      if (!parse_remote(node["remote"], config.remote)) {
        return false;
      }
    }

    if (node["system"]) {
      if (!parse_system(node["system"], config.system)) {
        return false;
      }
    }

    if (node["accounts"]) {
      if (!parse_accounts(node["accounts"], config.accounts)) {
        return false;
      }
    }

    if (node["logging"]) {
      if (!parse_logging(node["logging"], config.logging)) {
        return false;
      }
    }

    CIRRUS_LOG_DEBUG(
      "Configuration loaded" << ::cirrus::logging::kv("accounts", config.accounts.size())
                             << ::cirrus::logging::kv("remote_root", config.remote.root)
    );
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_uploader(const YAML::Node& node, UploaderSection& uploader) {
  if (node["db_path"]) {
    uploader.db_path = node["db_path"].as<std::string>();
  }
  if (node["num_workers"]) {
    uploader.num_workers = node["num_workers"].as<int>();
  }
  if (node["batch_size"]) {
    uploader.batch_size = node["batch_size"].as<size_t>();
  }
  if (node["poll_interval_ms"]) {
    uploader.poll_interval_ms = node["poll_interval_ms"].as<int>();
  }

  // Parse retry section
  if (node["retry"]) {
    const auto& retry = node["retry"];
    if (retry["max_retries"]) {
      uploader.retry.max_retries = retry["max_retries"].as<int>();
    }
    if (retry["initial_delay_ms"]) {
      uploader.retry.initial_delay_ms = retry["initial_delay_ms"].as<int>();
    }
    if (retry["max_delay_ms"]) {
      uploader.retry.max_delay_ms = retry["max_delay_ms"].as<int>();
    }
    if (retry["exponential_base"]) {
      uploader.retry.exponential_base = retry["exponential_base"].as<double>();
    }
    if (retry["jitter"]) {
      uploader.retry.jitter = retry["jitter"].as<bool>();
    }
  }

  return true;
}

bool ConfigParser::parse_remote(const YAML::Node& node, RemoteSection& remote) {
  if (node["root"]) {
    remote.root = node["root"].as<std::string>();
  }
  if (node["local_storage_root"]) {
    remote.local_storage_root = node["local_storage_root"].as<std::string>();
  }
  if (node["quota_mb"]) {
    remote.quota_mb = node["quota_mb"].as<uint64_t>();
  }
  if (node["chunk_size_kb"]) {
    remote.chunk_size_kb = node["chunk_size_kb"].as<size_t>();
  }
  if (node["power_save_chunk_size_kb"]) {
    remote.power_save_chunk_size_kb = node["power_save_chunk_size_kb"].as<size_t>();
  }
  return true;
}

bool ConfigParser::parse_system(const YAML::Node& node, SystemSection& system) {
  if (node["net_class_path"]) {
    system.net_class_path = node["net_class_path"].as<std::string>();
  }
  if (node["power_supply_path"]) {
    system.power_supply_path = node["power_supply_path"].as<std::string>();
  }
  if (node["platform_profile_path"]) {
    system.platform_profile_path = node["platform_profile_path"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_accounts(const YAML::Node& node, std::vector<uploader::User>& accounts) {
  if (!node.IsSequence()) {
    last_error_ = "Accounts must be a sequence";
    return false;
  }

  accounts.clear();
  for (const auto& item : node) {
    uploader::User user;
    if (item.IsScalar()) {
      user.account_name = item.as<std::string>();
    } else if (item.IsMap()) {
      if (!item["name"]) {
        last_error_ = "Account entry is missing 'name'";
        return false;
      }
      user.account_name = item["name"].as<std::string>();
      if (item["display_name"]) {
        user.display_name = item["display_name"].as<std::string>();
      }
    } else {
      last_error_ = "Account entry must be a name or a map";
      return false;
    }
    if (user.display_name.empty()) {
      user.display_name = user.account_name;
    }
    accounts.push_back(user);
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingSection& logging) {
  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  // Parse file section
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<size_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<size_t>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

bool ConfigParser::validate(const AppConfig& config, std::string& error_msg) {
  if (config.uploader.db_path.empty()) {
    error_msg = "Uploader db_path is empty";
    return false;
  }
  if (config.uploader.num_workers < 1) {
    error_msg = "Uploader num_workers must be at least 1";
    return false;
  }
  if (config.uploader.batch_size == 0) {
    error_msg = "Uploader batch_size must be at least 1";
    return false;
  }
  if (config.uploader.poll_interval_ms <= 0) {
    error_msg = "Uploader poll_interval_ms must be positive";
    return false;
  }

  const auto& retry = config.uploader.retry;
  if (retry.max_retries < 0) {
    error_msg = "Retry max_retries must not be negative";
    return false;
  }
  if (retry.initial_delay_ms <= 0 || retry.max_delay_ms < retry.initial_delay_ms) {
    error_msg = "Retry delays must be positive and max_delay_ms >= initial_delay_ms";
    return false;
  }
  if (retry.exponential_base < 1.0) {
    error_msg = "Retry exponential_base must be at least 1.0";
    return false;
  }

  if (config.remote.root.empty()) {
    error_msg = "Remote root is empty";
    return false;
  }
  if (config.remote.chunk_size_kb == 0 || config.remote.power_save_chunk_size_kb == 0) {
    error_msg = "Remote chunk sizes must be positive";
    return false;
  }

  if (config.accounts.empty()) {
    error_msg = "No accounts configured";
    return false;
  }
  std::set<std::string> seen;
  for (const auto& user : config.accounts) {
    if (user.account_name.find_first_not_of(" \t") == std::string::npos) {
      error_msg = "Account name is blank";
      return false;
    }
    if (!seen.insert(user.account_name).second) {
      error_msg = "Duplicate account: " + user.account_name;
      return false;
    }
  }

  const auto& logging = config.logging;
  if (!::cirrus::logging::parse_severity_level(logging.console_level) ||
      !::cirrus::logging::parse_severity_level(logging.file_level)) {
    error_msg = "Unknown logging level";
    return false;
  }
  if (logging.file_format != "json" && logging.file_format != "text") {
    error_msg = "Logging file format must be 'json' or 'text'";
    return false;
  }

  return true;
}

void convert_logging_config(
  const LoggingSection& yaml_config, ::cirrus::logging::LoggingConfig& log_config
) {
  // Console settings
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;

  if (auto level = ::cirrus::logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }

  // File settings
  log_config.file_enabled = yaml_config.file_enabled;

  if (auto level = ::cirrus::logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }

  log_config.file_config.directory = yaml_config.file_directory;
  log_config.file_config.file_pattern = yaml_config.file_pattern;
  log_config.file_config.format_json = (yaml_config.file_format == "json");
  log_config.file_config.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file_config.max_files = static_cast<int>(yaml_config.max_files);
  log_config.file_config.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

uploader::SchedulerConfig to_scheduler_config(const UploaderSection& section) {
  uploader::SchedulerConfig config;
  config.num_workers = section.num_workers;
  config.batch_size = section.batch_size;
  config.poll_interval = std::chrono::milliseconds(section.poll_interval_ms);
  config.retry.max_retries = section.retry.max_retries;
  config.retry.initial_delay = std::chrono::milliseconds(section.retry.initial_delay_ms);
  config.retry.max_delay = std::chrono::milliseconds(section.retry.max_delay_ms);
  config.retry.exponential_base = section.retry.exponential_base;
  config.retry.jitter = section.retry.jitter;
  return config;
}

uploader::MirrorConfig to_mirror_config(const RemoteSection& section) {
  uploader::MirrorConfig config;
  config.remote_root = section.root;
  config.local_storage_root = section.local_storage_root;
  config.quota_bytes = section.quota_mb * 1024 * 1024;
  config.chunk_size = section.chunk_size_kb * 1024;
  config.power_save_chunk_size = section.power_save_chunk_size_kb * 1024;
  return config;
}

}  // namespace app
}  // namespace cirrus
