// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_EVENT_BROADCASTER_HPP
#define CIRRUS_EVENT_BROADCASTER_HPP

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * EventBroadcaster - delivers upload events to in-process listeners
 *
 * Every event is a JSON object:
 *   {"type": "<event type>", "data": {...}, "timestamp": "<ISO 8601>"}
 *
 * Listeners are called synchronously on the emitting thread. A listener
 * that throws is logged and does not prevent delivery to the others.
 */
class EventBroadcaster : public IBroadcastEmitter {
public:
  using Listener = std::function<void(const nlohmann::json& event)>;
  using ListenerId = uint64_t;

  EventBroadcaster() = default;

  // Non-copyable
  EventBroadcaster(const EventBroadcaster&) = delete;
  EventBroadcaster& operator=(const EventBroadcaster&) = delete;

  void emit(const std::string& type, const nlohmann::json& data) override;

  /**
   * @return Id to pass to unsubscribe()
   */
  ListenerId subscribe(Listener listener);

  /**
   * @return false if id was not subscribed
   */
  bool unsubscribe(ListenerId id);

  size_t listener_count() const;

  uint64_t events_emitted() const {
    return events_emitted_.load();
  }

private:
  static std::string get_timestamp();

  mutable std::mutex mutex_;
  std::map<ListenerId, Listener> listeners_;
  ListenerId next_id_ = 1;
  std::atomic<uint64_t> events_emitted_{0};
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_EVENT_BROADCASTER_HPP
