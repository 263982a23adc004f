#include <gtest/gtest.h>

#include "fakes.h"
#include "state_machine/state_machine.h"

namespace {

HhrActivity activity(const std::string& id, bool active) {
  HhrActivity a;
  a.id = id;
  a.label = "Activity " + id;
  a.is_active = active;
  return a;
}

}  // namespace

TEST(UiTransition, IdleAcceptsOnlyItsEvents) {
  HhrUiContext ctx;
  EXPECT_EQ(hhr_ui_transition(HhrUiState::IDLE, ctx, hhr_ui_event(HhrUiEventType::DISCOVER)).next,
            HhrUiState::DISCOVERING);
  EXPECT_EQ(hhr_ui_transition(HhrUiState::IDLE, ctx, hhr_ui_event(HhrUiEventType::LOAD_CACHE)).next,
            HhrUiState::LOADING_CACHE);
  EXPECT_FALSE(hhr_ui_transition(HhrUiState::IDLE, ctx, hhr_ui_event(HhrUiEventType::CONNECTED)).accepted);
  EXPECT_FALSE(hhr_ui_transition(HhrUiState::IDLE, ctx, hhr_ui_event(HhrUiEventType::DISCONNECT)).accepted);
  EXPECT_FALSE(hhr_ui_transition(HhrUiState::IDLE, ctx, hhr_ui_command_event("10", "PowerOn")).accepted);
}

TEST(UiTransition, ConnectIsGuardedBySelectedHub) {
  HhrUiContext ctx;
  EXPECT_FALSE(hhr_ui_transition(HhrUiState::IDLE, ctx, hhr_ui_event(HhrUiEventType::CONNECT)).accepted);
  ctx.has_selected_hub = true;
  ctx.selected_hub = fake_hub();
  HhrUiTransition t = hhr_ui_transition(HhrUiState::IDLE, ctx, hhr_ui_event(HhrUiEventType::CONNECT));
  EXPECT_TRUE(t.accepted);
  EXPECT_EQ(t.next, HhrUiState::CONNECTING);
}

TEST(UiTransition, SelectHubRequiresHubId) {
  HhrUiContext ctx;
  EXPECT_FALSE(hhr_ui_transition(HhrUiState::IDLE, ctx, hhr_ui_hub_event(HhrUiEventType::SELECT_HUB, HhrHub()))
                   .accepted);
  HhrUiTransition t = hhr_ui_transition(HhrUiState::IDLE, ctx, hhr_ui_hub_event(HhrUiEventType::SELECT_HUB, fake_hub()));
  ASSERT_TRUE(t.accepted);
  EXPECT_EQ(t.next, HhrUiState::IDLE);
  ASSERT_EQ(t.actions.size(), 1u);
  EXPECT_EQ(t.actions[0], HhrUiActionType::SELECT_HUB);
}

TEST(UiTransition, ErrorIsAcceptedEverywhereAndLandsInIdle) {
  HhrUiContext ctx;
  const HhrUiState states[] = {HhrUiState::IDLE, HhrUiState::LOADING_CACHE, HhrUiState::DISCOVERING,
                               HhrUiState::CONNECTING, HhrUiState::FETCHING_CONFIG, HhrUiState::CONNECTED,
                               HhrUiState::DISCONNECTING};
  for (HhrUiState s : states) {
    HhrUiTransition t = hhr_ui_transition(s, ctx, hhr_ui_error_event(hhr_network_error("x", "boom")));
    EXPECT_TRUE(t.accepted) << hhr_ui_state_to_string(s);
    EXPECT_EQ(t.next, HhrUiState::IDLE);
    ASSERT_EQ(t.actions.size(), 1u);
    EXPECT_EQ(t.actions[0], HhrUiActionType::SET_ERROR);
  }
}

TEST(UiTransition, ConnectedHandlesCommandsAndActivities) {
  HhrUiContext ctx;
  HhrUiTransition t = hhr_ui_transition(HhrUiState::CONNECTED, ctx, hhr_ui_activity_event("100"));
  EXPECT_EQ(t.next, HhrUiState::CONNECTED);
  EXPECT_EQ(t.actions[0], HhrUiActionType::UPDATE_ACTIVITY);
  t = hhr_ui_transition(HhrUiState::CONNECTED, ctx, hhr_ui_command_event("10", "PowerOn"));
  EXPECT_EQ(t.actions[0], HhrUiActionType::EXECUTE_COMMAND);
  EXPECT_FALSE(hhr_ui_transition(HhrUiState::CONNECTED, ctx, hhr_ui_event(HhrUiEventType::DISCOVER)).accepted);
}

TEST(UiApplyAction, UpdateActivityMarksExactlyOneActive) {
  HhrUiContext ctx;
  ctx.activities.push_back(activity("1", true));
  ctx.activities.push_back(activity("2", false));
  ctx.activities.push_back(activity("3", false));

  hhr_ui_apply_action(HhrUiActionType::UPDATE_ACTIVITY, hhr_ui_activity_event("3"), ctx);
  EXPECT_FALSE(ctx.activities[0].is_active);
  EXPECT_FALSE(ctx.activities[1].is_active);
  EXPECT_TRUE(ctx.activities[2].is_active);
  EXPECT_EQ(ctx.current_activity_id, "3");
}

TEST(UiApplyAction, AddDiscoveredHubSkipsDuplicates) {
  HhrUiContext ctx;
  HhrUiEvent ev = hhr_ui_hub_event(HhrUiEventType::HUB_FOUND, fake_hub());
  hhr_ui_apply_action(HhrUiActionType::ADD_DISCOVERED_HUB, ev, ctx);
  hhr_ui_apply_action(HhrUiActionType::ADD_DISCOVERED_HUB, ev, ctx);
  EXPECT_EQ(ctx.hubs.size(), 1u);
}

class StateOrchestratorTest : public ::testing::Test {
 protected:
  StateOrchestratorTest() : ui(&log) { log.begin(&clock); }

  FakeClock clock;
  HhrEventLogger log;
  HhrStateOrchestrator ui;
};

TEST_F(StateOrchestratorTest, FullConnectFlow) {
  ASSERT_TRUE(ui.send(hhr_ui_event(HhrUiEventType::DISCOVER)));
  std::vector<HhrHub> hubs(1, fake_hub());
  ASSERT_TRUE(ui.send(hhr_ui_hubs_event(hubs)));
  EXPECT_EQ(ui.state(), HhrUiState::IDLE);
  ASSERT_TRUE(ui.send(hhr_ui_hub_event(HhrUiEventType::SELECT_HUB, hubs[0])));
  ASSERT_TRUE(ui.send(hhr_ui_event(HhrUiEventType::CONNECT)));
  ASSERT_TRUE(ui.send(hhr_ui_event(HhrUiEventType::CONNECTED)));
  EXPECT_EQ(ui.state(), HhrUiState::FETCHING_CONFIG);

  std::vector<HhrActivity> acts;
  acts.push_back(activity("1", false));
  acts.push_back(activity("2", true));
  ASSERT_TRUE(ui.send(hhr_ui_config_event(acts, std::vector<HhrDevice>())));
  EXPECT_EQ(ui.state(), HhrUiState::CONNECTED);

  HhrUiContext ctx = ui.context();
  EXPECT_EQ(ctx.hubs.size(), 1u);
  EXPECT_TRUE(ctx.has_selected_hub);
  EXPECT_EQ(ctx.current_activity_id, "2");

  ASSERT_TRUE(ui.send(hhr_ui_event(HhrUiEventType::DISCONNECT)));
  ASSERT_TRUE(ui.send(hhr_ui_event(HhrUiEventType::DISCONNECTED)));
  EXPECT_EQ(ui.state(), HhrUiState::IDLE);
}

TEST_F(StateOrchestratorTest, CacheLoadSeedsContext) {
  ASSERT_TRUE(ui.send(hhr_ui_event(HhrUiEventType::LOAD_CACHE)));
  HhrCachedData data;
  data.hub = fake_hub();
  data.activities.push_back(activity("7", true));
  ASSERT_TRUE(ui.send(hhr_ui_cache_event(data)));
  EXPECT_EQ(ui.state(), HhrUiState::CONNECTED);
  HhrUiContext ctx = ui.context();
  EXPECT_EQ(ctx.selected_hub.id, "hub-1");
  EXPECT_EQ(ctx.current_activity_id, "7");
}

TEST_F(StateOrchestratorTest, RejectedEventLeavesStateAndContext) {
  ASSERT_TRUE(ui.send(hhr_ui_event(HhrUiEventType::LOAD_CACHE)));
  EXPECT_FALSE(ui.send(hhr_ui_hub_event(HhrUiEventType::SELECT_HUB, fake_hub())));
  EXPECT_EQ(ui.state(), HhrUiState::LOADING_CACHE);
  EXPECT_FALSE(ui.context().has_selected_hub);

  DynamicJsonDocument events(16384);
  log.recent_events(events, 1);
  EXPECT_STREQ(events[0]["event_type"] | "", "event_rejected");
  EXPECT_STREQ(events[0]["state"] | "", "LOADING_CACHE");
}

TEST_F(StateOrchestratorTest, ErrorInIdleIsRecorded) {
  ASSERT_TRUE(ui.send(hhr_ui_error_event(hhr_network_error("connect_timeout", "Connection to hub timed out"))));
  EXPECT_EQ(ui.state(), HhrUiState::IDLE);
  HhrUiContext ctx = ui.context();
  EXPECT_TRUE(ctx.has_error);
  EXPECT_EQ(ctx.error.code, "connect_timeout");
}
