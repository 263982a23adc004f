// src/diagnostics.h
// Role: Chip and heap facts for the boot log and /api/status.
#pragma once
#include <Arduino.h>
#include <ArduinoJson.h>

#include <string>

struct HhrDeviceInfo {
  const char* reset_reason = "UNKNOWN";
  std::string device_suffix;  // last 4 hex chars of the station MAC
  const char* chip_model = "";
  uint32_t free_heap = 0;
  uint32_t min_free_heap = 0;
};

HhrDeviceInfo hhr_device_info();

// Adds reset_reason, device_suffix, chip_model, heap figures to `out`.
void hhr_device_info_to_json(const HhrDeviceInfo& info, JsonObject out);
