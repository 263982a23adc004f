#include <gtest/gtest.h>

#include "fakes.h"
#include "logging/event_logger.h"
#include "notify/notifier.h"
#include "version.h"

class EventLoggerTest : public ::testing::Test {
 protected:
  EventLoggerTest() {
    log.begin(&clock);
    log.set_sink([this](const std::string& line) { lines.push_back(line); });
  }

  FakeClock clock;
  HhrEventLogger log;
  std::vector<std::string> lines;
};

TEST_F(EventLoggerTest, LineCarriesStructuredFields) {
  StaticJsonDocument<64> extra;
  extra["port"] = 61991;
  JsonObjectConst o = extra.as<JsonObjectConst>();
  log.log_info("discovery", "listener_started", "discovery listener started", &o);

  ASSERT_EQ(lines.size(), 1u);
  StaticJsonDocument<512> d;
  ASSERT_FALSE(deserializeJson(d, lines[0]));
  EXPECT_STREQ(d["ts"] | "", "2025-10-09T08:53:20Z");
  EXPECT_EQ(d["seq"].as<uint32_t>(), 1u);
  EXPECT_STREQ(d["event_type"] | "", "listener_started");
  EXPECT_STREQ(d["severity"] | "", "info");
  EXPECT_STREQ(d["source"] | "", "discovery");
  EXPECT_STREQ(d["msg"] | "", "discovery listener started");
  EXPECT_EQ(d["port"].as<int>(), 61991);
  EXPECT_FALSE(d.containsKey("time_valid"));
}

TEST_F(EventLoggerTest, FlagsTimeBeforeClockSync) {
  clock.set(42000);
  log.log_warn("wifi", "sta_join_failed", "join failed");
  StaticJsonDocument<512> d;
  ASSERT_FALSE(deserializeJson(d, lines.back()));
  EXPECT_TRUE(d.containsKey("time_valid"));
  EXPECT_FALSE(d["time_valid"].as<bool>());
}

TEST_F(EventLoggerTest, DebugLinesFollowRuntimeSwitch) {
  log.set_debug_enabled(false);
  log.log_debug("ui", "ui_transition", "state transition");
  EXPECT_TRUE(lines.empty());
  EXPECT_EQ(log.event_count(), 0u);

  log.set_debug_enabled(true);
  log.log_debug("ui", "ui_transition", "state transition");
#if HHR_FEATURE_DEBUG_LOG
  EXPECT_EQ(lines.size(), 1u);
#else
  EXPECT_TRUE(lines.empty());
#endif
}

TEST_F(EventLoggerTest, RingKeepsNewestSixty) {
  for (int i = 0; i < 65; i++) log.log_info("core", "tick", "tick");
  EXPECT_EQ(log.event_count(), 60u);
  EXPECT_EQ(log.last_seq(), 65u);

  DynamicJsonDocument all(32768);
  log.recent_events(all, 0);
  ASSERT_EQ(all.size(), 60u);
  EXPECT_EQ(all[0]["seq"].as<uint32_t>(), 6u);
  EXPECT_EQ(all[59]["seq"].as<uint32_t>(), 65u);

  DynamicJsonDocument few(4096);
  log.recent_events(few, 5);
  ASSERT_EQ(few.size(), 5u);
  EXPECT_EQ(few[0]["seq"].as<uint32_t>(), 61u);
}

TEST_F(EventLoggerTest, ConfigChangeListsKeyNames) {
  StaticJsonDocument<128> keys;
  keys.add("connect_timeout_ms");
  keys.add("debug_logging");
  log.log_config_change("ui", keys.as<JsonArrayConst>());

  StaticJsonDocument<512> d;
  ASSERT_FALSE(deserializeJson(d, lines.back()));
  EXPECT_STREQ(d["event_type"] | "", "config_change");
  ASSERT_EQ(d["keys"].size(), 2u);
  EXPECT_STREQ(d["keys"][1] | "", "debug_logging");
}

TEST_F(EventLoggerTest, NotifierMirrorsToLog) {
  HhrNotifier notifier(&log);
  notifier.warning("No Hubs Found", "Make sure your Harmony Hub is on the same network");

  StaticJsonDocument<512> d;
  ASSERT_FALSE(deserializeJson(d, lines.back()));
  EXPECT_STREQ(d["severity"] | "", "warn");
  EXPECT_STREQ(d["source"] | "", "notify");
  EXPECT_STREQ(d["msg"] | "", "No Hubs Found: Make sure your Harmony Hub is on the same network");
  EXPECT_STREQ(d["level"] | "", "warning");

  DynamicJsonDocument out(1024);
  notifier.recent_json(out, 0);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0]["seq"].as<uint32_t>(), 1u);
  EXPECT_STREQ(out[0]["title"] | "", "No Hubs Found");
}
