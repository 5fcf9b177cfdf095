// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOADER_SYSTEM_SERVICES_HPP
#define CIRRUS_UPLOADER_SYSTEM_SERVICES_HPP

#include <string>

#include "uploader_interfaces.hpp"

namespace cirrus {
namespace app {

/**
 * Network state from /sys/class/net
 *
 * Connected when any interface other than loopback reports operstate "up".
 * Captive portals are not detected, so isInternetWalled() is always false.
 */
class SysfsConnectivityService : public uploader::IConnectivityService {
public:
  explicit SysfsConnectivityService(std::string net_class_path = "/sys/class/net");

  bool isConnected() const override;

  bool isInternetWalled() const override {
    return false;
  }

private:
  std::string net_class_path_;
};

/**
 * Power state from /sys/class/power_supply and the ACPI platform profile
 *
 * A machine without a battery counts as charging. Power-saving mode is the
 * "low-power" or "quiet" platform profile.
 */
class SysfsPowerManagementService : public uploader::IPowerManagementService {
public:
  SysfsPowerManagementService(
    std::string power_supply_path = "/sys/class/power_supply",
    std::string platform_profile_path = "/sys/firmware/acpi/platform_profile"
  );

  bool isBatteryCharging() const override;

  bool isPowerSaveMode() const override;

private:
  std::string power_supply_path_;
  std::string platform_profile_path_;
};

/**
 * First line of a sysfs attribute, trimmed; empty if unreadable
 */
std::string readSysfsValue(const std::string& path);

}  // namespace app
}  // namespace cirrus

#endif  // CIRRUS_UPLOADER_SYSTEM_SERVICES_HPP
