// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "system_services.hpp"

#include <filesystem>
#include <fstream>
#include <utility>

#define CIRRUS_LOG_COMPONENT "system_services"
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace app {

namespace fs = std::filesystem;
using cirrus::logging::kv;

std::string readSysfsValue(const std::string& path) {
  std::ifstream in(path);
  if (!in.good()) {
    return "";
  }
  std::string value;
  std::getline(in, value);
  auto end = value.find_last_not_of(" \t\r\n");
  if (end == std::string::npos) {
    return "";
  }
  auto begin = value.find_first_not_of(" \t");
  return value.substr(begin, end - begin + 1);
}

// ============================================================================
// SysfsConnectivityService
// ============================================================================

SysfsConnectivityService::SysfsConnectivityService(std::string net_class_path)
    : net_class_path_(std::move(net_class_path)) {}

bool SysfsConnectivityService::isConnected() const {
  std::error_code ec;
  fs::directory_iterator it(net_class_path_, ec);
  if (ec) {
    CIRRUS_LOG_WARN_THROTTLE(
      60.0, "Cannot read network interfaces" << kv("path", net_class_path_)
                                             << kv("error", ec.message())
    );
    return false;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::string name = it->path().filename().string();
    if (name == "lo") {
      continue;
    }
    if (readSysfsValue((it->path() / "operstate").string()) == "up") {
      return true;
    }
  }
  return false;
}

// ============================================================================
// SysfsPowerManagementService
// ============================================================================

SysfsPowerManagementService::SysfsPowerManagementService(
  std::string power_supply_path, std::string platform_profile_path
)
    : power_supply_path_(std::move(power_supply_path))
    , platform_profile_path_(std::move(platform_profile_path)) {}

bool SysfsPowerManagementService::isBatteryCharging() const {
  std::error_code ec;
  fs::directory_iterator it(power_supply_path_, ec);
  if (ec) {
    return true;
  }

  bool has_battery = false;
  bool on_mains = false;
  bool battery_charging = false;

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::string type = readSysfsValue((it->path() / "type").string());
    if (type == "Mains" || type == "USB") {
      if (readSysfsValue((it->path() / "online").string()) == "1") {
        on_mains = true;
      }
    } else if (type == "Battery") {
      has_battery = true;
      std::string status = readSysfsValue((it->path() / "status").string());
      if (status == "Charging" || status == "Full") {
        battery_charging = true;
      }
    }
  }

  if (!has_battery) {
    return true;
  }
  return on_mains || battery_charging;
}

bool SysfsPowerManagementService::isPowerSaveMode() const {
  std::string profile = readSysfsValue(platform_profile_path_);
  return profile == "low-power" || profile == "quiet";
}

}  // namespace app
}  // namespace cirrus
