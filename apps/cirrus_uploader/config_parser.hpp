// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOADER_CONFIG_PARSER_HPP
#define CIRRUS_UPLOADER_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

#include "uploader_config.hpp"

namespace cirrus {
namespace logging {
struct LoggingConfig;
}
namespace uploader {
struct SchedulerConfig;
struct MirrorConfig;
}  // namespace uploader
}  // namespace cirrus

namespace cirrus {
namespace app {

/**
 * Convert the YAML logging section to cirrus::logging::LoggingConfig.
 * Unknown level names keep the library defaults.
 */
void convert_logging_config(
  const LoggingSection& yaml_config, ::cirrus::logging::LoggingConfig& log_config
);

uploader::SchedulerConfig to_scheduler_config(const UploaderSection& section);

uploader::MirrorConfig to_mirror_config(const RemoteSection& section);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, AppConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, AppConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const AppConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_uploader(const YAML::Node& node, UploaderSection& uploader);
  bool parse_remote(const YAML::Node& node, RemoteSection& remote);
  bool parse_system(const YAML::Node& node, SystemSection& system);
  bool parse_accounts(const YAML::Node& node, std::vector<uploader::User>& accounts);
  bool parse_logging(const YAML::Node& node, LoggingSection& logging);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace app
}  // namespace cirrus

#endif  // CIRRUS_UPLOADER_CONFIG_PARSER_HPP
