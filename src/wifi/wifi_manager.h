// src/wifi/wifi_manager.h
// Role: Wi-Fi mode manager (STA join + NTP, AP fallback) driven by ConfigStore.
#pragma once

#include <Arduino.h>

class HhrConfigStore;
class HhrEventLogger;

struct HhrWifiStatus {
  String mode;   // "AP" | "STA" | "OTHER"
  String ssid;   // active SSID (if any)
  String ip;     // IP string
  int32_t rssi;  // STA RSSI if connected
  bool connected;
};

// Joins the configured network (and starts SNTP) or falls back to the
// provisioning AP. Returns true when STA is up.
bool hhr_wifi_begin(const HhrConfigStore& cfg, HhrEventLogger& log);
HhrWifiStatus hhr_wifi_status();
