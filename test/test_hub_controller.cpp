#include <gtest/gtest.h>

#include "controller/hub_controller.h"
#include "fakes.h"

namespace {

const char* const kHubA = R"({"uuid":"hub-1","friendlyName":"Living Room","ip":"192.168.1.20","remoteId":"111"})";
const char* const kHubB = R"({"uuid":"hub-2","friendlyName":"Bedroom","ip":"192.168.1.21"})";

}  // namespace

class HubControllerTest : public ::testing::Test {
 protected:
  HubControllerTest()
      : notifier(&log),
        sessions(kv, clock, &notifier, &log),
        cache(kv, clock, &log),
        factory(script),
        cm(factory, sessions, cache, clock, &log),
        discovery(listener, clock, &log),
        ui(&log),
        errors(sessions, notifier, &log),
        controller(cm, discovery, cache, ui, errors, notifier, &log) {
    log.begin(&clock);
    cm.attach_discovery(&discovery);
  }

  HhrNotification last_notification() {
    HhrNotification n;
    EXPECT_TRUE(notifier.last(n));
    return n;
  }

  void connect_to_first_hub() {
    listener.announcements = {kHubA, kHubB};
    HhrError err;
    ASSERT_TRUE(controller.discover(err)) << err.message;
    ASSERT_TRUE(controller.select_hub("hub-1", err)) << err.message;
    ASSERT_TRUE(controller.connect_selected(err)) << err.message;
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
  FakeListener listener;
  HhrDiscoveryEngine discovery;
  HhrStateOrchestrator ui;
  HhrErrorDispatcher errors;
  HhrHubController controller;
};

TEST_F(HubControllerTest, DiscoverRecordsHubs) {
  listener.announcements = {kHubA, kHubB};
  HhrError err;
  ASSERT_TRUE(controller.discover(err));
  EXPECT_EQ(ui.state(), HhrUiState::IDLE);
  EXPECT_EQ(ui.context().hubs.size(), 2u);

  HhrNotification n = last_notification();
  EXPECT_EQ(n.level, HhrNotifyLevel::SUCCESS);
  EXPECT_EQ(n.title, "Discovery Complete");
  EXPECT_EQ(n.message, "Found 2 hub(s)");
}

TEST_F(HubControllerTest, DiscoverWithNoHubsWarns) {
  HhrError err;
  ASSERT_TRUE(controller.discover(err));
  HhrNotification n = last_notification();
  EXPECT_EQ(n.level, HhrNotifyLevel::WARNING);
  EXPECT_EQ(n.title, "No Hubs Found");
}

TEST_F(HubControllerTest, DiscoverFailureReturnsUiToIdleWithError) {
  listener.busy_ports = {61991, 61992, 61993, 61994, 61995};
  HhrError err;
  ASSERT_FALSE(controller.discover(err));
  EXPECT_EQ(err.code, "port_in_use");
  EXPECT_EQ(ui.state(), HhrUiState::IDLE);
  EXPECT_TRUE(ui.context().has_error);

  HhrNotification n = last_notification();
  EXPECT_EQ(n.title, "Network Error");
  EXPECT_EQ(n.message, "All ports in use. Please try again later. (1/3)");
}

TEST_F(HubControllerTest, DiscoveryPrefetchWarmsCache) {
  discovery.set_prefetcher(&cm);
  listener.announcements = {kHubA};
  HhrError err;
  ASSERT_TRUE(controller.discover(err));
  EXPECT_TRUE(kv.has(kHhrKeyHubCache));
}

TEST_F(HubControllerTest, SelectingUnknownHubFails) {
  HhrError err;
  ASSERT_FALSE(controller.select_hub("nope", err));
  EXPECT_EQ(err.category, HhrErrorCategory::VALIDATION);
  EXPECT_EQ(err.code, "unknown_hub");
  EXPECT_EQ(last_notification().title, "Validation Error");
  EXPECT_FALSE(ui.context().has_selected_hub);
}

TEST_F(HubControllerTest, ConnectWithoutSelectionIsRejected) {
  HhrError err;
  ASSERT_FALSE(controller.connect_selected(err));
  EXPECT_EQ(err.code, "invalid_state");
  EXPECT_EQ(err.message, "Cannot connect while IDLE");
  EXPECT_EQ(factory.created, 0);
}

TEST_F(HubControllerTest, ConnectLoadsConfigAndCachesIt) {
  connect_to_first_hub();
  EXPECT_EQ(ui.state(), HhrUiState::CONNECTED);
  HhrUiContext ctx = ui.context();
  EXPECT_EQ(ctx.selected_hub.id, "hub-1");
  EXPECT_EQ(ctx.activities.size(), 3u);
  EXPECT_EQ(ctx.devices.size(), 3u);
  EXPECT_EQ(ctx.current_activity_id, "100");
  EXPECT_TRUE(kv.has(kHhrKeyHubCache));
  EXPECT_EQ(last_notification().title, "Connected");
}

TEST_F(HubControllerTest, ConnectFailureResetsUi) {
  script.probe_always_fails = true;
  listener.announcements = {kHubA};
  HhrError err;
  ASSERT_TRUE(controller.discover(err));
  ASSERT_TRUE(controller.select_hub("hub-1", err));
  ASSERT_FALSE(controller.connect_selected(err));
  EXPECT_EQ(err.code, "connect_timeout");
  EXPECT_EQ(ui.state(), HhrUiState::IDLE);
  EXPECT_EQ(cm.state(), HhrConnectionState::DISCONNECTED);
  EXPECT_EQ(errors.network_failures(), 1u);
}

TEST_F(HubControllerTest, CommandsRequireConnectedUi) {
  HhrError err;
  ASSERT_FALSE(controller.execute_command("10", "PowerOn", err));
  EXPECT_EQ(err.code, "invalid_state");
  EXPECT_TRUE(script.holds.empty());
}

TEST_F(HubControllerTest, CommandIsSentAndRecorded) {
  connect_to_first_hub();
  HhrError err;
  ASSERT_TRUE(controller.execute_command("10", "PowerOn", err));
  EXPECT_EQ(script.holds.size(), 2u);
  EXPECT_EQ(ui.context().last_command_id, "PowerOn");
  EXPECT_EQ(last_notification().title, "Command Sent");
}

TEST_F(HubControllerTest, ExpiredSessionDropsBackToIdle) {
  connect_to_first_hub();
  clock.advance(kHhrSessionInactivityMs + 1);

  HhrError err;
  ASSERT_FALSE(controller.execute_command("10", "PowerOn", err));
  EXPECT_EQ(err.category, HhrErrorCategory::AUTHENTICATION);
  EXPECT_EQ(ui.state(), HhrUiState::IDLE);
  EXPECT_FALSE(kv.has(kHhrKeySession));
  EXPECT_EQ(last_notification().title, "Authentication Error");
}

TEST_F(HubControllerTest, StartActivityUpdatesCurrentActivity) {
  connect_to_first_hub();
  HhrError err;
  ASSERT_TRUE(controller.start_activity("200", err));
  HhrUiContext ctx = ui.context();
  EXPECT_EQ(ctx.current_activity_id, "200");
  EXPECT_FALSE(ctx.activities[1].is_active);
  EXPECT_TRUE(ctx.activities[2].is_active);
}

TEST_F(HubControllerTest, LoadCacheConnectsLive) {
  connect_to_first_hub();
  HhrError err;
  ASSERT_TRUE(controller.disconnect(err));
  ASSERT_EQ(ui.state(), HhrUiState::IDLE);
  const int opens = script.opens;

  ASSERT_TRUE(controller.load_cache(err)) << err.message;
  EXPECT_EQ(ui.state(), HhrUiState::CONNECTED);
  EXPECT_EQ(script.opens, opens + 1);
  EXPECT_EQ(cm.state(), HhrConnectionState::CONNECTED);
  EXPECT_EQ(ui.context().selected_hub.id, "hub-1");
  EXPECT_EQ(ui.context().devices.size(), 3u);
}

TEST_F(HubControllerTest, LoadCacheWithoutRecordReturnsToIdle) {
  HhrError err;
  ASSERT_TRUE(controller.load_cache(err));
  EXPECT_EQ(ui.state(), HhrUiState::IDLE);
  EXPECT_EQ(factory.created, 0);
}

TEST_F(HubControllerTest, StaleCacheIsNotUsed) {
  connect_to_first_hub();
  HhrError err;
  ASSERT_TRUE(controller.disconnect(err));
  controller.set_cache_duration_s(60);
  clock.advance(61 * 1000);

  const int opens = script.opens;
  ASSERT_TRUE(controller.load_cache(err));
  EXPECT_EQ(ui.state(), HhrUiState::IDLE);
  EXPECT_EQ(script.opens, opens);
  EXPECT_FALSE(kv.has(kHhrKeyHubCache));
}

TEST_F(HubControllerTest, DisconnectReturnsToIdle) {
  connect_to_first_hub();
  HhrError err;
  ASSERT_TRUE(controller.disconnect(err));
  EXPECT_EQ(ui.state(), HhrUiState::IDLE);
  EXPECT_EQ(cm.state(), HhrConnectionState::DISCONNECTED);
  EXPECT_EQ(last_notification().title, "Disconnected");
}

TEST_F(HubControllerTest, ClearCacheForgetsEverything) {
  connect_to_first_hub();
  HhrError err;
  ASSERT_TRUE(controller.clear_cache(err));
  EXPECT_EQ(ui.state(), HhrUiState::IDLE);
  EXPECT_FALSE(kv.has(kHhrKeyHubCache));
  EXPECT_FALSE(kv.has(kHhrKeySession));
  EXPECT_TRUE(discovery.discovered().empty());
  EXPECT_EQ(last_notification().title, "Cache Cleared");

  ASSERT_FALSE(controller.select_hub("hub-1", err));
  EXPECT_EQ(err.code, "unknown_hub");
}

TEST_F(HubControllerTest, QueueIsBoundedAndDrainedInOrder) {
  HhrRequest req;
  req.type = HhrRequestType::DISCONNECT;
  HhrError err;
  for (size_t i = 0; i < kHhrMaxPendingRequests; i++) {
    ASSERT_TRUE(controller.enqueue(req, err));
  }
  ASSERT_FALSE(controller.enqueue(req, err));
  EXPECT_EQ(err.code, "queue_full");
  EXPECT_EQ(controller.status().pending, kHhrMaxPendingRequests);

  EXPECT_EQ(controller.run_pending(), kHhrMaxPendingRequests);
  HhrControllerStatus s = controller.status();
  EXPECT_EQ(s.pending, 0u);
  EXPECT_FALSE(s.busy);
  EXPECT_TRUE(s.has_last);
  EXPECT_EQ(s.last_type, HhrRequestType::DISCONNECT);
  EXPECT_TRUE(s.last_ok);
}

TEST_F(HubControllerTest, QueuedFailureIsReportedInStatus) {
  HhrRequest req;
  req.type = HhrRequestType::EXECUTE_COMMAND;
  req.device_id = "10";
  req.command_id = "PowerOn";
  HhrError err;
  ASSERT_TRUE(controller.enqueue(req, err));
  EXPECT_EQ(controller.run_pending(), 1u);

  HhrControllerStatus s = controller.status();
  EXPECT_FALSE(s.last_ok);
  EXPECT_EQ(s.last_error.code, "invalid_state");
}
