// src/wifi/wifi_manager.cpp
// Role: Wi-Fi mode manager (STA join + NTP, AP fallback) driven by ConfigStore.

#include "wifi_manager.h"

#include <WiFi.h>
#include <ArduinoJson.h>
#include <time.h>

#include <string>

#include "../config/config_store.h"
#include "../logging/event_logger.h"

static void log_wifi_mode(HhrEventLogger& log, const char* mode, const char* reason, const std::string& ssid,
                          const std::string& ip) {
  StaticJsonDocument<256> extra;
  extra["mode"] = mode;
  extra["reason"] = reason;
  if (!ssid.empty()) extra["ssid"] = ssid;
  if (!ip.empty()) extra["ip"] = ip;
  JsonObjectConst o = extra.as<JsonObjectConst>();
  log.log_info("wifi", "wifi_mode_change", std::string("wifi ") + mode, &o);
}

static void start_ap(const HhrConfigStore& cfg, HhrEventLogger& log) {
  std::string ssid = cfg.doc()["wifi_ap_ssid"] | "Harmony Remote";
  std::string pass = cfg.doc()["wifi_ap_password"] | "";
  if (pass.size() < 8) pass = "ChangeMe-" + cfg.device_suffix();

  WiFi.mode(WIFI_AP);
  WiFi.softAP(ssid.c_str(), pass.c_str());

  log_wifi_mode(log, "AP", "fallback_or_config", ssid, WiFi.softAPIP().toString().c_str());
}

static void start_ntp(const HhrConfigStore& cfg, HhrEventLogger& log) {
  std::string server = cfg.ntp_server();
  if (server.empty()) return;
  configTime(0, 0, server.c_str());
  StaticJsonDocument<128> extra;
  extra["server"] = server;
  JsonObjectConst o = extra.as<JsonObjectConst>();
  log.log_info("wifi", "ntp_started", "sntp sync requested", &o);
}

static bool try_sta(const HhrConfigStore& cfg, HhrEventLogger& log) {
  bool sta_en = cfg.doc()["wifi_sta_enabled"] | false;
  if (!sta_en) return false;

  std::string ssid = cfg.doc()["wifi_sta_ssid"] | "";
  std::string pass = cfg.doc()["wifi_sta_password"] | "";
  int timeout_s = cfg.doc()["wifi_sta_connect_timeout_s"] | 20;

  if (ssid.empty()) return false;

  WiFi.mode(WIFI_STA);
  WiFi.begin(ssid.c_str(), pass.c_str());
  uint32_t start = millis();
  while (millis() - start < (uint32_t)timeout_s * 1000UL) {
    if (WiFi.status() == WL_CONNECTED) {
      log_wifi_mode(log, "STA", "sta_join_ok", ssid, WiFi.localIP().toString().c_str());
      return true;
    }
    delay(100);
  }

  log_wifi_mode(log, "AP", "sta_join_failed", ssid, "");
  WiFi.disconnect(true, true);
  return false;
}

bool hhr_wifi_begin(const HhrConfigStore& cfg, HhrEventLogger& log) {
  if (try_sta(cfg, log)) {
    start_ntp(cfg, log);
    return true;
  }
  start_ap(cfg, log);
  return false;
}

HhrWifiStatus hhr_wifi_status() {
  HhrWifiStatus s;
  wifi_mode_t m = WiFi.getMode();
  if (m == WIFI_AP) {
    s.mode = "AP";
    s.ssid = WiFi.softAPSSID();
    s.ip = WiFi.softAPIP().toString();
    s.rssi = 0;
    s.connected = false;
  } else if (m == WIFI_STA) {
    s.mode = "STA";
    s.ssid = WiFi.SSID();
    s.ip = WiFi.localIP().toString();
    s.rssi = WiFi.RSSI();
    s.connected = WiFi.status() == WL_CONNECTED;
  } else {
    s.mode = "OTHER";
    s.ssid = "";
    s.ip = "";
    s.rssi = 0;
    s.connected = false;
  }
  return s;
}
