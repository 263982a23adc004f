// src/hub/validator.cpp
// Role: Sanitizes and type-checks hub records and raw hub responses.

#include "validator.h"

#include <stdlib.h>

#include "hub_json.h"

namespace {

template <typename T>
struct FieldRule {
  const char* field;
  bool (*check)(const T&);
  const char* message;
};

template <typename T, size_t N>
bool run_rules(const T& candidate, const FieldRule<T> (&rules)[N], const char* code, HhrError& err) {
  for (size_t i = 0; i < N; i++) {
    if (!rules[i].check(candidate)) {
      err = hhr_validation_error(code, rules[i].message);
      return false;
    }
  }
  return true;
}

bool hub_id_ok(const HhrHub& h) { return !h.id.empty(); }
bool hub_name_ok(const HhrHub& h) { return !h.friendly_name.empty(); }
bool hub_ip_ok(const HhrHub& h) { return hhr_is_dotted_ipv4(h.ip); }

const FieldRule<HhrHub> kHubRules[] = {
  {"id", hub_id_ok, "Hub ID must be a non-empty string"},
  {"friendlyName", hub_name_ok, "Hub friendly name must be a non-empty string"},
  {"ip", hub_ip_ok, "Hub IP must be a valid IPv4 address"},
};

bool activity_id_ok(const HhrActivity& a) { return !a.id.empty(); }
bool activity_label_ok(const HhrActivity& a) { return !a.label.empty(); }

const FieldRule<HhrActivity> kActivityRules[] = {
  {"id", activity_id_ok, "Activity ID must be a non-empty string"},
  {"label", activity_label_ok, "Activity label must be a non-empty string"},
};

bool command_id_ok(const HhrCommand& c) { return !c.id.empty(); }
bool command_label_ok(const HhrCommand& c) { return !c.label.empty(); }
bool command_device_ok(const HhrCommand& c) { return !c.device_id.empty(); }

const FieldRule<HhrCommand> kCommandRules[] = {
  {"id", command_id_ok, "Command ID must be a non-empty string"},
  {"label", command_label_ok, "Command label must be a non-empty string"},
  {"deviceId", command_device_ok, "Command device ID must be a non-empty string"},
};

bool device_id_ok(const HhrDevice& d) { return !d.id.empty(); }
bool device_label_ok(const HhrDevice& d) { return !d.label.empty(); }

// `commands` is typed as a vector; non-array wire values are coerced to [] by
// hhr_validate_device_response before these rules run.
const FieldRule<HhrDevice> kDeviceRules[] = {
  {"id", device_id_ok, "Device ID must be a non-empty string"},
  {"label", device_label_ok, "Device label must be a non-empty string"},
};

void wrap(HhrError& err, const char* code, const char* prefix) {
  std::string msg = std::string(prefix) + ": " + err.message;
  err = hhr_validation_error(code, msg);
}

const char* const kHubIdKeys[] = {"id", "uuid", nullptr};
const char* const kHubVersionKeys[] = {"hubVersion", "current_fw_version", nullptr};

}  // namespace

bool hhr_is_dotted_ipv4(const std::string& s) {
  int groups = 0;
  size_t i = 0;
  const size_t n = s.size();
  while (groups < 4) {
    size_t digits = 0;
    while (i < n && s[i] >= '0' && s[i] <= '9') {
      i++;
      digits++;
    }
    if (digits < 1 || digits > 3) return false;
    groups++;
    if (groups < 4) {
      if (i >= n || s[i] != '.') return false;
      i++;
    }
  }
  return i == n;
}

bool hhr_validate_hub(const HhrHub& hub, HhrError& err) {
  return run_rules(hub, kHubRules, "invalid_hub", err);
}

bool hhr_validate_activity(const HhrActivity& activity, HhrError& err) {
  return run_rules(activity, kActivityRules, "invalid_activity", err);
}

bool hhr_validate_command(const HhrCommand& command, HhrError& err) {
  return run_rules(command, kCommandRules, "invalid_command", err);
}

bool hhr_validate_device(const HhrDevice& device, HhrError& err) {
  if (!run_rules(device, kDeviceRules, "invalid_device", err)) return false;
  for (const auto& c : device.commands) {
    if (!hhr_validate_command(c, err)) return false;
  }
  return true;
}

bool hhr_validate_hub_response(JsonVariantConst raw, HhrHub& out, HhrError& err) {
  JsonObjectConst o = raw.as<JsonObjectConst>();
  HhrHub hub;
  hub.id = hhr_json_first_string(o, kHubIdKeys);
  hub.friendly_name = hhr_json_string(o["friendlyName"]);
  hub.ip = hhr_json_string(o["ip"]);
  hub.remote_id = hhr_json_string(o["remoteId"]);
  hub.hub_version = hhr_json_first_string(o, kHubVersionKeys);
  long port = 0;
  if (o["port"].is<long>()) {
    port = o["port"].as<long>();
  } else {
    std::string p = hhr_json_string(o["port"]);
    if (!p.empty()) port = strtol(p.c_str(), nullptr, 10);
  }
  hub.port = (port > 0 && port <= 65535) ? (uint16_t)port : 0;

  if (!hhr_validate_hub(hub, err)) {
    wrap(err, "invalid_hub_response", "Hub response validation failed");
    return false;
  }
  out = hub;
  return true;
}

bool hhr_validate_activity_response(JsonVariantConst raw, HhrActivity& out, HhrError& err) {
  JsonObjectConst o = raw.as<JsonObjectConst>();
  HhrActivity activity;
  activity.id = hhr_json_string(o["id"]);
  activity.label = hhr_json_string(o["label"]);
  activity.is_active = hhr_json_bool(o["isActive"]);
  if (!hhr_validate_activity(activity, err)) {
    wrap(err, "invalid_activity_response", "Activity response validation failed");
    return false;
  }
  out = activity;
  return true;
}

bool hhr_validate_command_response(JsonVariantConst raw, const std::string& device_id,
                                   HhrCommand& out, HhrError& err) {
  JsonObjectConst o = raw.as<JsonObjectConst>();
  HhrCommand command;
  command.id = hhr_json_string(o["id"]);
  command.label = hhr_json_string(o["label"]);
  command.device_id = hhr_json_string(o["deviceId"]);
  if (command.device_id.empty()) command.device_id = device_id;
  if (!hhr_validate_command(command, err)) {
    wrap(err, "invalid_command_response", "Command response validation failed");
    return false;
  }
  out = command;
  return true;
}

bool hhr_validate_device_response(JsonVariantConst raw, HhrDevice& out, HhrError& err) {
  JsonObjectConst o = raw.as<JsonObjectConst>();
  HhrDevice device;
  device.id = hhr_json_string(o["id"]);
  device.label = hhr_json_string(o["label"]);
  device.type = hhr_json_string(o["type"]);

  if (!run_rules(device, kDeviceRules, "invalid_device", err)) {
    wrap(err, "invalid_device_response", "Device response validation failed");
    return false;
  }

  JsonArrayConst cmds = o["commands"].as<JsonArrayConst>();
  if (!cmds.isNull()) {
    for (JsonVariantConst v : cmds) {
      HhrCommand c;
      if (!hhr_validate_command_response(v, device.id, c, err)) {
        wrap(err, "invalid_device_response", "Device response validation failed");
        return false;
      }
      device.commands.push_back(c);
    }
  }
  out = device;
  return true;
}
