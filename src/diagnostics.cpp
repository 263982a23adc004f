// src/diagnostics.cpp
#include "diagnostics.h"

#include <WiFi.h>
#include <esp_system.h>
#include <stdio.h>

struct ResetReasonName {
  esp_reset_reason_t reason;
  const char* name;
};

static const ResetReasonName kResetReasons[] = {
  {ESP_RST_POWERON, "POWERON"},  {ESP_RST_EXT, "EXT"},           {ESP_RST_SW, "SW"},
  {ESP_RST_PANIC, "PANIC"},      {ESP_RST_INT_WDT, "INT_WDT"},   {ESP_RST_TASK_WDT, "TASK_WDT"},
  {ESP_RST_WDT, "WDT"},          {ESP_RST_BROWNOUT, "BROWNOUT"}, {ESP_RST_DEEPSLEEP, "DEEPSLEEP"},
};

static const char* reset_reason_name(esp_reset_reason_t r) {
  for (const auto& e : kResetReasons) {
    if (e.reason == r) return e.name;
  }
  return "UNKNOWN";
}

HhrDeviceInfo hhr_device_info() {
  HhrDeviceInfo info;
  info.reset_reason = reset_reason_name(esp_reset_reason());

  uint8_t mac[6] = {0};
  WiFi.macAddress(mac);
  char suffix[5];
  snprintf(suffix, sizeof(suffix), "%02X%02X", mac[4], mac[5]);
  info.device_suffix = suffix;

  info.chip_model = ESP.getChipModel();
  info.free_heap = ESP.getFreeHeap();
  info.min_free_heap = ESP.getMinFreeHeap();
  return info;
}

void hhr_device_info_to_json(const HhrDeviceInfo& info, JsonObject out) {
  out["reset_reason"] = info.reset_reason;
  out["device_suffix"] = info.device_suffix;
  out["chip_model"] = info.chip_model;
  out["free_heap"] = info.free_heap;
  out["min_free_heap"] = info.min_free_heap;
}
