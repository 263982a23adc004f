// src/hub/hub_types.h
// Role: Domain records for hubs, activities, devices and the cached snapshot.
#pragma once

#include <stdint.h>

#include <string>
#include <vector>

// Identity is `id`. Replaced wholesale on rediscovery.
struct HhrHub {
  std::string id;
  std::string friendly_name;
  std::string ip;
  std::string remote_id;    // empty when the hub did not announce one
  uint16_t port = 0;        // 0 when absent
  std::string hub_version;  // firmware version, empty when absent
};

struct HhrActivity {
  std::string id;
  std::string label;
  bool is_active = false;
};

// `device_id` is a lookup back-reference into the owning HhrDevice.
struct HhrCommand {
  std::string id;
  std::string label;
  std::string device_id;
};

struct HhrDevice {
  std::string id;
  std::string label;
  std::string type;
  std::vector<HhrCommand> commands;
};

struct HhrSession {
  std::string token;
  int64_t expires_at_ms = 0;
  int64_t last_activity_at_ms = 0;
};

// Derived snapshot; rebuildable from a live connection.
struct HhrCachedData {
  HhrHub hub;
  std::vector<HhrActivity> activities;
  std::vector<HhrDevice> devices;
  int64_t timestamp_ms = 0;
};

enum class HhrConnectionState : uint8_t {
  DISCONNECTED = 0,
  CONNECTING,
  CONNECTED,
};

const char* hhr_connection_state_to_string(HhrConnectionState s);
