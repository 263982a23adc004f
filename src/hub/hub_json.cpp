// src/hub/hub_json.cpp
// Role: ArduinoJson encoders for hub records + loose wire-field coercion helpers.

#include "hub_json.h"

#include <stdio.h>

const char* hhr_connection_state_to_string(HhrConnectionState s) {
  switch (s) {
    case HhrConnectionState::DISCONNECTED: return "disconnected";
    case HhrConnectionState::CONNECTING: return "connecting";
    case HhrConnectionState::CONNECTED: return "connected";
  }
  return "disconnected";
}

void hhr_hub_to_json(const HhrHub& hub, JsonObject out) {
  out["id"] = hub.id;
  out["friendlyName"] = hub.friendly_name;
  out["ip"] = hub.ip;
  if (!hub.remote_id.empty()) out["remoteId"] = hub.remote_id;
  if (hub.port != 0) out["port"] = hub.port;
  if (!hub.hub_version.empty()) out["hubVersion"] = hub.hub_version;
}

void hhr_activity_to_json(const HhrActivity& activity, JsonObject out) {
  out["id"] = activity.id;
  out["label"] = activity.label;
  out["isActive"] = activity.is_active;
}

void hhr_command_to_json(const HhrCommand& command, JsonObject out) {
  out["id"] = command.id;
  out["label"] = command.label;
  out["deviceId"] = command.device_id;
}

void hhr_device_to_json(const HhrDevice& device, JsonObject out) {
  out["id"] = device.id;
  out["label"] = device.label;
  out["type"] = device.type;
  JsonArray cmds = out.createNestedArray("commands");
  for (const auto& c : device.commands) {
    hhr_command_to_json(c, cmds.createNestedObject());
  }
}

void hhr_cached_data_to_json(const HhrCachedData& data, JsonObject out) {
  hhr_hub_to_json(data.hub, out.createNestedObject("hub"));
  JsonArray acts = out.createNestedArray("activities");
  for (const auto& a : data.activities) {
    hhr_activity_to_json(a, acts.createNestedObject());
  }
  JsonArray devs = out.createNestedArray("devices");
  for (const auto& d : data.devices) {
    hhr_device_to_json(d, devs.createNestedObject());
  }
  out["timestamp"] = data.timestamp_ms;
}

std::string hhr_json_string(JsonVariantConst v) {
  if (v.isNull()) return std::string();
  if (v.is<const char*>()) {
    const char* s = v.as<const char*>();
    return s ? std::string(s) : std::string();
  }
  if (v.is<bool>()) return v.as<bool>() ? std::string("true") : std::string();
  if (v.is<long>()) {
    long n = v.as<long>();
    if (n == 0) return std::string();
    char buf[24];
    snprintf(buf, sizeof(buf), "%ld", n);
    return std::string(buf);
  }
  if (v.is<double>()) {
    double d = v.as<double>();
    if (d == 0.0) return std::string();
    char buf[32];
    snprintf(buf, sizeof(buf), "%g", d);
    return std::string(buf);
  }
  return std::string();
}

bool hhr_json_bool(JsonVariantConst v) {
  if (v.isNull()) return false;
  if (v.is<bool>()) return v.as<bool>();
  if (v.is<const char*>()) {
    const char* s = v.as<const char*>();
    return s && s[0] != '\0';
  }
  if (v.is<long>()) return v.as<long>() != 0;
  if (v.is<double>()) return v.as<double>() != 0.0;
  return true;
}

std::string hhr_json_first_string(JsonObjectConst obj, const char* const* keys) {
  for (size_t i = 0; keys[i] != nullptr; i++) {
    std::string s = hhr_json_string(obj[keys[i]]);
    if (!s.empty()) return s;
  }
  return std::string();
}
