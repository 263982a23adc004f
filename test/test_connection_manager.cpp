#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "connection/connection_manager.h"
#include "discovery/discovery_engine.h"
#include "fakes.h"

class ConnectionManagerTest : public ::testing::Test {
 protected:
  ConnectionManagerTest()
      : notifier(&log),
        sessions(kv, clock, &notifier, &log),
        cache(kv, clock, &log),
        factory(script),
        cm(factory, sessions, cache, clock, &log) {
    log.begin(&clock);
  }

  void connect_ok() {
    HhrError err;
    ASSERT_TRUE(cm.connect(fake_hub(), err)) << err.message;
    clock.clear_delays();
  }

  FakeClock clock;
  MemoryKvStore kv;
  HhrEventLogger log;
  HhrNotifier notifier;
  HhrSessionStore sessions;
  HhrCacheStore cache;
  FakeHubScript script;
  FakeTransportFactory factory;
  HhrConnectionManager cm;
};

TEST_F(ConnectionManagerTest, ConnectOpensProbesAndCreatesSession) {
  HhrError err;
  ASSERT_TRUE(cm.connect(fake_hub(), err));
  EXPECT_EQ(cm.state(), HhrConnectionState::CONNECTED);
  EXPECT_TRUE(cm.has_transport());
  EXPECT_EQ(script.opens, 1);
  EXPECT_EQ(script.probes, 1);

  HhrHub last;
  ASSERT_TRUE(cm.last_hub(last));
  EXPECT_EQ(last.id, "hub-1");

  HhrSession s;
  ASSERT_TRUE(sessions.get_session(s));
  EXPECT_EQ(s.token, "hub-1");
}

TEST_F(ConnectionManagerTest, ConnectTimesOutAfterProbing) {
  script.probe_always_fails = true;
  HhrError err;
  ASSERT_FALSE(cm.connect(fake_hub(), err));
  EXPECT_EQ(err.category, HhrErrorCategory::NETWORK);
  EXPECT_EQ(err.code, "connect_timeout");
  EXPECT_EQ(err.message, "Connection to hub timed out");

  // Probes at 0, 500, ..., 5000 ms.
  EXPECT_EQ(script.probes, 11);
  EXPECT_EQ(clock.delays(), std::vector<uint32_t>(10, 500));
  EXPECT_EQ(cm.state(), HhrConnectionState::DISCONNECTED);
  EXPECT_FALSE(cm.has_transport());
  EXPECT_EQ(script.ends, 1);

  HhrHub last;
  EXPECT_FALSE(cm.last_hub(last));
  EXPECT_FALSE(kv.has(kHhrKeySession));
}

TEST_F(ConnectionManagerTest, ConnectSucceedsOnLaterProbe) {
  script.probe_failures = 3;
  HhrError err;
  ASSERT_TRUE(cm.connect(fake_hub(), err));
  EXPECT_EQ(script.probes, 4);
  EXPECT_EQ(clock.delays(), std::vector<uint32_t>(3, 500));
}

TEST_F(ConnectionManagerTest, InvalidHubIsRejectedBeforeConnecting) {
  HhrError err;
  ASSERT_FALSE(cm.connect(fake_hub("hub-1", "living-room"), err));
  EXPECT_EQ(err.category, HhrErrorCategory::VALIDATION);
  EXPECT_EQ(factory.created, 0);
  EXPECT_EQ(cm.state(), HhrConnectionState::DISCONNECTED);
}

TEST_F(ConnectionManagerTest, OpenFailureLeavesNoHandle) {
  script.open_ok = false;
  HhrError err;
  ASSERT_FALSE(cm.connect(fake_hub(), err));
  EXPECT_EQ(err.category, HhrErrorCategory::NETWORK);
  EXPECT_EQ(cm.state(), HhrConnectionState::DISCONNECTED);
  EXPECT_FALSE(cm.has_transport());
}

TEST_F(ConnectionManagerTest, MissingTransportIsUnknownError) {
  factory.return_null = true;
  HhrError err;
  ASSERT_FALSE(cm.connect(fake_hub(), err));
  EXPECT_EQ(err.category, HhrErrorCategory::UNKNOWN);
  EXPECT_EQ(err.code, "transport_unavailable");
}

TEST_F(ConnectionManagerTest, ReconnectReleasesOldHandleAndSettles) {
  connect_ok();
  HhrError err;
  ASSERT_TRUE(cm.connect(fake_hub("hub-2", "192.168.1.30"), err));
  EXPECT_EQ(script.ends, 1);
  EXPECT_EQ(script.opens, 2);
  EXPECT_EQ(clock.delays(), std::vector<uint32_t>(1, 1000));

  HhrHub last;
  ASSERT_TRUE(cm.last_hub(last));
  EXPECT_EQ(last.id, "hub-2");
}

TEST_F(ConnectionManagerTest, DisconnectAlwaysReleases) {
  connect_ok();
  script.end_ok = false;
  HhrError err;
  EXPECT_FALSE(cm.disconnect(err));
  EXPECT_EQ(cm.state(), HhrConnectionState::DISCONNECTED);
  EXPECT_FALSE(cm.has_transport());

  HhrError again;
  EXPECT_TRUE(cm.disconnect(again));
}

TEST_F(ConnectionManagerTest, EnsureConnectedReportsMissingAndLostHandles) {
  HhrError err;
  ASSERT_FALSE(cm.ensure_connected(err));
  EXPECT_EQ(err.code, "not_connected");
  EXPECT_EQ(err.message, "Not connected to hub. Please select a hub first.");

  connect_ok();
  script.probe_failures = 1;
  ASSERT_FALSE(cm.ensure_connected(err));
  EXPECT_EQ(err.code, "lost_connection");
  EXPECT_EQ(err.message, "Lost connection to hub");
  EXPECT_FALSE(cm.has_transport());
  EXPECT_EQ(cm.state(), HhrConnectionState::DISCONNECTED);
}

TEST_F(ConnectionManagerTest, EnsureConnectedOrReconnectUsesLastHub) {
  connect_ok();
  script.probe_failures = 1;
  HhrError err;
  ASSERT_TRUE(cm.ensure_connected_or_reconnect(err));
  EXPECT_EQ(script.opens, 2);
  EXPECT_EQ(cm.state(), HhrConnectionState::CONNECTED);
}

TEST_F(ConnectionManagerTest, EnsureConnectedOrReconnectWithoutHistoryFails) {
  HhrError err;
  ASSERT_FALSE(cm.ensure_connected_or_reconnect(err));
  EXPECT_EQ(err.code, "not_connected");
  EXPECT_EQ(factory.created, 0);
}

TEST_F(ConnectionManagerTest, ActivitiesKeepSingleActiveFlag) {
  script.activities_json =
      R"([{"id":"1","label":"A","isActive":true},{"id":"2","label":"B","isActive":true},{"id":"3","label":"C"}])";
  connect_ok();

  std::vector<HhrActivity> acts;
  HhrError err;
  ASSERT_TRUE(cm.get_activities(acts, err));
  ASSERT_EQ(acts.size(), 3u);
  EXPECT_TRUE(acts[0].is_active);
  EXPECT_FALSE(acts[1].is_active);
  EXPECT_FALSE(acts[2].is_active);
}

TEST_F(ConnectionManagerTest, QueriesRequireSession) {
  connect_ok();
  sessions.clear_session();

  std::vector<HhrActivity> acts;
  HhrError err;
  ASSERT_FALSE(cm.get_activities(acts, err));
  EXPECT_EQ(err.category, HhrErrorCategory::AUTHENTICATION);
  EXPECT_EQ(err.message, "Session expired. Please reconnect to your Hub");

  HhrNotification n;
  ASSERT_TRUE(notifier.last(n));
  EXPECT_EQ(n.title, "Session Expired");
}

TEST_F(ConnectionManagerTest, DevicesAreFlattenedFromControlGroups) {
  connect_ok();
  std::vector<HhrDevice> devices;
  HhrError err;
  ASSERT_TRUE(cm.get_devices(devices, err)) << err.message;
  ASSERT_EQ(devices.size(), 3u);

  const HhrDevice& tv = devices[0];
  EXPECT_EQ(tv.type, "Television");
  ASSERT_EQ(tv.commands.size(), 4u);
  EXPECT_EQ(tv.commands[0].id, "PowerOn");
  EXPECT_EQ(tv.commands[0].label, "Power On");
  EXPECT_EQ(tv.commands[2].id, "VolumeUp");
  EXPECT_EQ(tv.commands[3].label, "VolumeDown");
  for (const auto& c : tv.commands) EXPECT_EQ(c.device_id, "10");

  EXPECT_EQ(devices[1].type, "AV Receiver");
  EXPECT_TRUE(devices[1].commands.empty());
  EXPECT_EQ(devices[2].type, "Default");
}

TEST_F(ConnectionManagerTest, InvalidDeviceFailsTheWholeList) {
  script.devices_json = R"({"device":[{"id":"10","label":"TV"},{"id":"20","label":""}]})";
  connect_ok();
  std::vector<HhrDevice> devices;
  HhrError err;
  ASSERT_FALSE(cm.get_devices(devices, err));
  EXPECT_EQ(err.category, HhrErrorCategory::VALIDATION);
  EXPECT_EQ(err.message, "Device response validation failed: Device label must be a non-empty string");
  EXPECT_TRUE(devices.empty());
}

TEST_F(ConnectionManagerTest, StartActivityForwardsToHub) {
  connect_ok();
  HhrError err;
  ASSERT_TRUE(cm.start_activity("100", err));
  ASSERT_EQ(script.started_activities.size(), 1u);
  EXPECT_EQ(script.started_activities[0], "100");

  ASSERT_FALSE(cm.start_activity("", err));
  EXPECT_EQ(err.category, HhrErrorCategory::VALIDATION);
}

TEST_F(ConnectionManagerTest, CommandIsPressThenReleaseAfterHold) {
  connect_ok();
  HhrError err;
  ASSERT_TRUE(cm.execute_command("10", "PowerOn", err));

  ASSERT_EQ(script.holds.size(), 2u);
  EXPECT_EQ(script.holds[0].status, HhrHoldStatus::PRESS);
  EXPECT_EQ(script.holds[1].status, HhrHoldStatus::RELEASE);
  EXPECT_EQ(script.holds[0].command, "PowerOn");
  EXPECT_EQ(script.holds[0].device_id, "10");
  EXPECT_EQ(script.holds[1].timestamp_ms - script.holds[0].timestamp_ms, 100);
  EXPECT_EQ(cm.retry_count(), 0);
}

TEST_F(ConnectionManagerTest, HoldTimeFollowsTiming) {
  HhrConnectionTiming t;
  t.command_hold_ms = 250;
  cm.set_timing(t);
  connect_ok();
  HhrError err;
  ASSERT_TRUE(cm.execute_command("10", "PowerOn", err));
  EXPECT_EQ(script.holds[1].timestamp_ms - script.holds[0].timestamp_ms, 250);
}

TEST_F(ConnectionManagerTest, CommandRetriesAfterBackoffAndReconnect) {
  HhrConnectionTiming t;
  t.settle_delay_ms = 0;
  cm.set_timing(t);
  connect_ok();
  script.hold_failures = 1;

  HhrError err;
  ASSERT_TRUE(cm.execute_command("10", "PowerOn", err)) << err.message;
  EXPECT_EQ(clock.delays_at_least(1000), std::vector<uint32_t>(1, 1000));
  EXPECT_EQ(script.opens, 2);
  EXPECT_EQ(script.holds.size(), 2u);
  EXPECT_EQ(cm.retry_count(), 0);
}

TEST_F(ConnectionManagerTest, CommandGivesUpAfterThreeAttempts) {
  HhrConnectionTiming t;
  t.settle_delay_ms = 0;
  cm.set_timing(t);
  connect_ok();
  script.hold_failures = 100;

  HhrError err;
  ASSERT_FALSE(cm.execute_command("10", "PowerOn", err));
  EXPECT_EQ(err.category, HhrErrorCategory::NETWORK);
  EXPECT_EQ(err.code, "send_failed");
  EXPECT_EQ(clock.delays_at_least(1000), (std::vector<uint32_t>{1000, 2000, 4000}));
  // Initial connection plus one reconnect before each remaining attempt.
  EXPECT_EQ(script.opens, 3);
  EXPECT_EQ(cm.retry_count(), 3);
}

TEST_F(ConnectionManagerTest, CommandAgainstDeadHubRunsThreeAttempts) {
  connect_ok();
  script.probe_always_fails = true;

  HhrError err;
  ASSERT_FALSE(cm.execute_command("10", "PowerOn", err));
  // The first liveness check drops the handle; both reconnects time out, so
  // the last attempt finds no handle at all.
  EXPECT_EQ(err.category, HhrErrorCategory::NETWORK);
  EXPECT_EQ(err.code, "not_connected");
  EXPECT_EQ(clock.delays_at_least(1000), (std::vector<uint32_t>{1000, 2000, 4000}));
  EXPECT_EQ(script.opens, 3);
  // connect_ok, attempt 1, then 11 checks per timed-out reconnect.
  EXPECT_EQ(script.probes, 1 + 1 + 11 + 11);
  EXPECT_TRUE(script.holds.empty());
  EXPECT_EQ(cm.retry_count(), 3);
  EXPECT_EQ(cm.state(), HhrConnectionState::DISCONNECTED);
}

TEST_F(ConnectionManagerTest, CommandRecoversWhenReconnectSucceeds) {
  connect_ok();
  script.probe_failures = 1;

  HhrError err;
  ASSERT_TRUE(cm.execute_command("10", "PowerOn", err)) << err.message;
  EXPECT_EQ(clock.delays_at_least(1000), std::vector<uint32_t>(1, 1000));
  EXPECT_EQ(script.opens, 2);
  EXPECT_EQ(script.holds.size(), 2u);
  EXPECT_EQ(cm.retry_count(), 0);
  EXPECT_EQ(cm.state(), HhrConnectionState::CONNECTED);
}

TEST_F(ConnectionManagerTest, StartActivityReconnectsWhenHubStopsAnswering) {
  connect_ok();
  script.probe_failures = 1;

  HhrError err;
  ASSERT_TRUE(cm.start_activity("200", err)) << err.message;
  EXPECT_EQ(script.opens, 2);
  ASSERT_EQ(script.started_activities.size(), 1u);
  EXPECT_EQ(script.started_activities[0], "200");
  EXPECT_EQ(cm.state(), HhrConnectionState::CONNECTED);
}

TEST_F(ConnectionManagerTest, StartActivityFailsWhenReconnectFails) {
  connect_ok();
  script.probe_always_fails = true;

  HhrError err;
  ASSERT_FALSE(cm.start_activity("200", err));
  EXPECT_EQ(err.code, "lost_connection");
  EXPECT_EQ(script.opens, 2);
  EXPECT_TRUE(script.started_activities.empty());
  EXPECT_FALSE(cm.has_transport());
}

TEST_F(ConnectionManagerTest, TimingIsReadableWhileHubCallIsBlocked) {
  connect_ok();
  std::unique_lock<std::mutex> hub_busy(script.mu);

  std::thread worker([this] {
    HhrError err;
    cm.execute_command("10", "PowerOn", err);
  });
  for (int i = 0; i < 5000 && script.liveness_calls.load() < 2; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  EXPECT_EQ(script.liveness_calls.load(), 2);

  HhrConnectionTiming t;
  t.command_hold_ms = 300;
  cm.set_timing(t);
  EXPECT_EQ(cm.timing().command_hold_ms, 300u);

  hub_busy.unlock();
  worker.join();
  ASSERT_EQ(script.holds.size(), 2u);
  EXPECT_EQ(script.holds[1].timestamp_ms - script.holds[0].timestamp_ms, 300);
}

TEST_F(ConnectionManagerTest, CommandWithoutConnectionExhaustsRetries) {
  HhrError err;
  ASSERT_TRUE(sessions.create_session("hub-1", err));
  ASSERT_FALSE(cm.execute_command("10", "PowerOn", err));
  EXPECT_EQ(err.code, "not_connected");
  EXPECT_EQ(clock.delays(), (std::vector<uint32_t>{1000, 2000, 4000}));
  EXPECT_EQ(factory.created, 0);
}

TEST_F(ConnectionManagerTest, ValidationErrorsAreNotRetried) {
  connect_ok();
  HhrError err;
  ASSERT_FALSE(cm.execute_command("", "PowerOn", err));
  EXPECT_EQ(err.category, HhrErrorCategory::VALIDATION);

  script.hold_failures = 1;
  script.hold_error = hhr_validation_error("bad_command", "Unknown command");
  ASSERT_FALSE(cm.execute_command("10", "Bogus", err));
  EXPECT_EQ(err.code, "bad_command");
  EXPECT_TRUE(clock.delays_at_least(1000).empty());
  EXPECT_TRUE(script.holds.empty());
}

TEST_F(ConnectionManagerTest, ExpiredSessionBlocksCommandWithoutRetry) {
  connect_ok();
  clock.advance(kHhrSessionInactivityMs + 1);

  HhrError err;
  ASSERT_FALSE(cm.execute_command("10", "PowerOn", err));
  EXPECT_EQ(err.category, HhrErrorCategory::AUTHENTICATION);
  EXPECT_TRUE(script.holds.empty());
  EXPECT_TRUE(clock.delays().empty());
}

TEST_F(ConnectionManagerTest, CacheHubDataConnectsWhenNeeded) {
  HhrError err;
  ASSERT_TRUE(cm.cache_hub_data(fake_hub(), err)) << err.message;
  EXPECT_EQ(script.opens, 1);
  EXPECT_TRUE(kv.has(kHhrKeyHubCache));

  ASSERT_TRUE(cm.cache_hub_data(fake_hub(), err));
  EXPECT_EQ(script.opens, 1);

  HhrCachedData data;
  bool found = false;
  ASSERT_TRUE(cache.load(0, data, found, err));
  ASSERT_TRUE(found);
  EXPECT_EQ(data.activities.size(), 3u);
  EXPECT_EQ(data.devices.size(), 3u);
}

TEST_F(ConnectionManagerTest, ClearCacheResetsEverything) {
  FakeListener listener;
  listener.announcements = {R"({"uuid":"hub-1","friendlyName":"Living Room","ip":"192.168.1.20"})"};
  HhrDiscoveryEngine discovery(listener, clock, &log);
  cm.attach_discovery(&discovery);

  std::vector<HhrHub> hubs;
  HhrError err;
  ASSERT_TRUE(discovery.discover_hubs(hubs, err));
  ASSERT_TRUE(cm.cache_hub_data(hubs[0], err));
  kv.put(kHhrKeyGeneralCache, "{}");
  kv.put(kHhrKeyConfig, "{}");

  ASSERT_TRUE(cm.clear_cache(err));
  EXPECT_FALSE(kv.has(kHhrKeyHubCache));
  EXPECT_FALSE(kv.has(kHhrKeySession));
  EXPECT_FALSE(kv.has(kHhrKeyGeneralCache));
  EXPECT_TRUE(kv.has(kHhrKeyConfig));
  EXPECT_EQ(cm.state(), HhrConnectionState::DISCONNECTED);
  EXPECT_FALSE(cm.has_transport());
  EXPECT_EQ(cm.retry_count(), 0);
  HhrHub last;
  EXPECT_FALSE(cm.last_hub(last));
  EXPECT_TRUE(discovery.discovered().empty());
}

TEST_F(ConnectionManagerTest, ClearCacheStillResetsWhenStoreFails) {
  connect_ok();
  kv.fail_remove_keys.insert(kHhrKeySession);

  HhrError err;
  ASSERT_FALSE(cm.clear_cache(err));
  EXPECT_EQ(err.category, HhrErrorCategory::CACHE_OPERATION);
  EXPECT_FALSE(cm.has_transport());
  HhrHub last;
  EXPECT_FALSE(cm.last_hub(last));
}
