// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "event_broadcaster.hpp"

#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

#define CIRRUS_LOG_COMPONENT "event_broadcaster"
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace uploader {

void EventBroadcaster::emit(const std::string& type, const nlohmann::json& data) {
  nlohmann::json event;
  event["type"] = type;
  event["data"] = data;
  event["timestamp"] = get_timestamp();

  // Listeners may subscribe or unsubscribe from inside a callback
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }

  events_emitted_++;

  for (const auto& listener : snapshot) {
    try {
      listener(event);
    } catch (const std::exception& e) {
      CIRRUS_LOG_WARN("Event listener failed for '" << type << "': " << e.what());
    }
  }
}

EventBroadcaster::ListenerId EventBroadcaster::subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  ListenerId id = next_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

bool EventBroadcaster::unsubscribe(ListenerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.erase(id) > 0;
}

size_t EventBroadcaster::listener_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.size();
}

std::string EventBroadcaster::get_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t_now = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm tm{};
  gmtime_r(&time_t_now, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

  return oss.str();
}

}  // namespace uploader
}  // namespace cirrus
