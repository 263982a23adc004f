// src/main.cpp
#include <Arduino.h>
#include <WiFi.h>

#include "version.h"
#include "diagnostics.h"
#include "web_server.h"

#include "config/config_store.h"
#include "connection/connection_manager.h"
#include "connection/ws_hub_transport.h"
#include "controller/hub_controller.h"
#include "discovery/discovery_engine.h"
#include "discovery/udp_discovery_listener.h"
#include "hub/error_dispatcher.h"
#include "logging/event_logger.h"
#include "notify/notifier.h"
#include "platform/arduino_clock.h"
#include "session/session_store.h"
#include "state_machine/state_machine.h"
#include "storage/cache_store.h"
#include "storage/prefs_kv_store.h"
#include "wifi/wifi_manager.h"

static const uint32_t kWorkerStackBytes = 12288;
static const uint32_t kWorkerIdleMs = 20;

static HhrArduinoClock g_clock;
static HhrPrefsKvStore g_kv;
static HhrEventLogger g_log;
static HhrNotifier g_notifier(&g_log);
static HhrConfigStore g_cfg(g_kv);
static HhrSessionStore g_sessions(g_kv, g_clock, &g_notifier, &g_log);
static HhrCacheStore g_cache(g_kv, g_clock, &g_log);
static HhrUdpDiscoveryListener g_listener;
static HhrDiscoveryEngine g_discovery(g_listener, g_clock, &g_log);
static HhrWsTransportFactory g_transports;
static HhrConnectionManager g_connection(g_transports, g_sessions, g_cache, g_clock, &g_log);
static HhrStateOrchestrator g_ui(&g_log);
static HhrErrorDispatcher g_errors(g_sessions, g_notifier, &g_log);
static HhrHubController g_controller(g_connection, g_discovery, g_cache, g_ui, g_errors, g_notifier, &g_log);

static void apply_runtime_config() {
  g_log.set_debug_enabled(g_cfg.debug_logging());
  g_connection.set_timing(g_cfg.connection_timing());
  g_discovery.set_options(g_cfg.discovery_options());
  g_controller.set_cache_duration_s(g_cfg.cache_duration_s());
}

// Drains the controller queue so HTTP handlers never block on the hub.
static void worker_task(void*) {
  for (;;) {
    if (g_controller.run_pending() == 0) {
      vTaskDelay(pdMS_TO_TICKS(kWorkerIdleMs));
    }
  }
}

void setup() {
  Serial.begin(115200);
  delay(200);

  const HhrDeviceInfo boot = hhr_device_info();

  Serial.println();
  Serial.println("[HHR] Boot");
  Serial.print("[HHR] Firmware: "); Serial.print(HHR_FIRMWARE_NAME); Serial.print(" "); Serial.println(HHR_FIRMWARE_VERSION);
  Serial.print("[HHR] Reset reason: "); Serial.println(boot.reset_reason);
  Serial.print("[HHR] Device suffix: "); Serial.println(boot.device_suffix.c_str());
  Serial.print("[HHR] Chip: "); Serial.println(boot.chip_model);

  g_log.begin(&g_clock);
  g_log.set_sink([](const std::string& line) { Serial.println(line.c_str()); });
  {
    StaticJsonDocument<256> extra;
    extra["reset_reason"] = boot.reset_reason;
    extra["firmware"] = HHR_FIRMWARE_VERSION;
    extra["free_heap"] = boot.free_heap;
    JsonObjectConst o = extra.as<JsonObjectConst>();
    g_log.log_info("core", "boot", "boot", &o);
  }

  bool cfg_ok = g_cfg.begin(boot.device_suffix, &g_log);
  Serial.print("[HHR] Config: "); Serial.println(cfg_ok ? "OK" : "DEFAULTS");
  apply_runtime_config();

  g_connection.attach_discovery(&g_discovery);
  g_discovery.set_prefetcher(&g_connection);

  bool sta = hhr_wifi_begin(g_cfg, g_log);
  Serial.print("[HHR] Wi-Fi: "); Serial.println(sta ? "STA" : "AP");

  xTaskCreatePinnedToCore(worker_task, "hhr_worker", kWorkerStackBytes, nullptr, 1, nullptr, 1);

  if (sta && g_cfg.auto_load_cache()) {
    HhrRequest req;
    req.type = HhrRequestType::LOAD_CACHE;
    HhrError err;
    if (!g_controller.enqueue(req, err)) {
      g_log.log_warn("core", "auto_load_skipped", err.message);
    }
  }

#if HHR_FEATURE_WEB
  HhrWebDeps deps;
  deps.cfg = &g_cfg;
  deps.log = &g_log;
  deps.notifier = &g_notifier;
  deps.connection = &g_connection;
  deps.discovery = &g_discovery;
  deps.ui = &g_ui;
  deps.controller = &g_controller;
  deps.apply_config = apply_runtime_config;
  hhr_web_begin(deps);
  Serial.println("[HHR] Web server: OK");
#endif
}

void loop() {
#if HHR_FEATURE_WEB
  hhr_web_loop();
#endif
  delay(5);
}
