// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for EventBroadcaster
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "event_broadcaster.hpp"

using namespace cirrus::uploader;
using json = nlohmann::json;

TEST(EventBroadcasterTest, DeliversEnvelope) {
  EventBroadcaster broadcaster;
  std::vector<json> received;
  broadcaster.subscribe([&](const json& event) {
    received.push_back(event);
  });

  broadcaster.emit("upload_finished", json{{"upload_id", 3}, {"result_code", "OK"}});

  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0]["type"], "upload_finished");
  EXPECT_EQ(received[0]["data"]["upload_id"], 3);
  EXPECT_EQ(received[0]["data"]["result_code"], "OK");

  std::string timestamp = received[0]["timestamp"].get<std::string>();
  EXPECT_FALSE(timestamp.empty());
  EXPECT_EQ(timestamp.back(), 'Z');
  EXPECT_EQ(broadcaster.events_emitted(), 1u);
}

TEST(EventBroadcasterTest, EmitWithoutListeners) {
  EventBroadcaster broadcaster;
  EXPECT_NO_THROW(broadcaster.emit("batch_finished", json::object()));
  EXPECT_EQ(broadcaster.events_emitted(), 1u);
}

TEST(EventBroadcasterTest, Unsubscribe) {
  EventBroadcaster broadcaster;
  int calls = 0;
  auto id = broadcaster.subscribe([&](const json&) {
    ++calls;
  });
  EXPECT_EQ(broadcaster.listener_count(), 1u);

  broadcaster.emit("upload_started", json::object());
  EXPECT_TRUE(broadcaster.unsubscribe(id));
  EXPECT_FALSE(broadcaster.unsubscribe(id));
  broadcaster.emit("upload_started", json::object());

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(broadcaster.listener_count(), 0u);
}

TEST(EventBroadcasterTest, ThrowingListenerDoesNotBlockOthers) {
  EventBroadcaster broadcaster;
  int calls = 0;
  broadcaster.subscribe([](const json&) {
    throw std::runtime_error("listener failed");
  });
  broadcaster.subscribe([&](const json&) {
    ++calls;
  });

  EXPECT_NO_THROW(broadcaster.emit("upload_started", json::object()));
  EXPECT_EQ(calls, 1);
}

TEST(EventBroadcasterTest, ListenerMayUnsubscribeItself) {
  EventBroadcaster broadcaster;
  EventBroadcaster::ListenerId id = 0;
  int calls = 0;
  id = broadcaster.subscribe([&](const json&) {
    ++calls;
    broadcaster.unsubscribe(id);
  });

  broadcaster.emit("a", json::object());
  broadcaster.emit("b", json::object());
  EXPECT_EQ(calls, 1);
}
