// src/connection/connection_manager.cpp
// Role: Owns the single hub connection: connect/probe/reconnect, queries, retried commands.

#include "connection_manager.h"

#include <ArduinoJson.h>

#include "../hub/hub_json.h"
#include "../hub/validator.h"

namespace {

const char* const kDefaultDeviceType = "Default";

// Lists returned by the hub sometimes flag more than one activity as running.
void keep_single_active(std::vector<HhrActivity>& activities, HhrEventLogger* logger) {
  bool seen = false;
  for (auto& a : activities) {
    if (!a.is_active) continue;
    if (!seen) {
      seen = true;
      continue;
    }
    a.is_active = false;
    if (logger) logger->log_warn("connection", "multiple_active", "cleared extra active flag on " + a.label);
  }
}

}  // namespace

void HhrConnectionManager::set_timing(const HhrConnectionTiming& timing) {
  std::lock_guard<std::mutex> lock(_timing_mu);
  _timing = timing;
}

HhrConnectionTiming HhrConnectionManager::timing() const {
  std::lock_guard<std::mutex> lock(_timing_mu);
  return _timing;
}

void HhrConnectionManager::attach_discovery(HhrDiscoveryEngine* discovery) {
  std::lock_guard<std::mutex> lock(_mu);
  _discovery = discovery;
}

bool HhrConnectionManager::last_hub(HhrHub& out) const {
  std::lock_guard<std::mutex> lock(_snapshot_mu);
  if (!_has_last_hub) return false;
  out = _last_hub;
  return true;
}

void HhrConnectionManager::set_state(HhrConnectionState s) {
  HhrConnectionState prev = _state.exchange(s);
  if (prev != s && _logger) {
    StaticJsonDocument<96> extra;
    extra["from"] = hhr_connection_state_to_string(prev);
    extra["to"] = hhr_connection_state_to_string(s);
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _logger->log_debug("connection", "state_change", "connection state changed", &o);
  }
}

bool HhrConnectionManager::release_locked(HhrError& err) {
  bool ok = true;
  if (_transport) {
    HhrError e;
    if (!_transport->end(e)) {
      if (_logger) _logger->log_warn("connection", "end_failed", e.message);
      err = e;
      ok = false;
    }
  }
  _transport.reset();
  _has_transport = false;
  set_state(HhrConnectionState::DISCONNECTED);
  return ok;
}

bool HhrConnectionManager::connect_locked(const HhrHub& hub, HhrError& err) {
  if (!hhr_validate_hub(hub, err)) return false;
  const HhrConnectionTiming t = timing();

  if (_transport) {
    if (_logger) _logger->log_info("connection", "replacing_connection", "closing existing hub connection");
    HhrError ignored;
    release_locked(ignored);
    _clock.delay_ms(t.settle_delay_ms);
  }

  set_state(HhrConnectionState::CONNECTING);
  if (_logger) _logger->log_info("connection", "connecting", "connecting to " + hub.friendly_name + " at " + hub.ip);

  _transport = _factory.create();
  if (!_transport) {
    set_state(HhrConnectionState::DISCONNECTED);
    err = hhr_unknown_error("transport_unavailable", "Could not create hub client");
    return false;
  }
  _has_transport = true;

  HhrError open_err;
  if (!_transport->open(hub, open_err)) {
    _transport.reset();
    _has_transport = false;
    set_state(HhrConnectionState::DISCONNECTED);
    err = open_err.category == HhrErrorCategory::NETWORK
              ? open_err
              : hhr_network_error("connect_failed", "Failed to connect to hub: " + open_err.message);
    if (_logger) _logger->log_error("connection", "connect_failed", err.message);
    return false;
  }

  const int64_t started = _clock.now_ms();
  bool alive = false;
  for (;;) {
    DynamicJsonDocument probe(kHhrActivityDocCapacity);
    HhrError probe_err;
    if (_transport->list_activities(probe, probe_err)) {
      alive = true;
      break;
    }
    if (_clock.now_ms() - started >= (int64_t)t.connect_timeout_ms) break;
    _clock.delay_ms(t.probe_interval_ms);
  }

  if (!alive) {
    HhrError ignored;
    release_locked(ignored);
    err = hhr_network_error("connect_timeout", "Connection to hub timed out");
    if (_logger) _logger->log_error("connection", "connect_timeout", err.message);
    return false;
  }

  set_state(HhrConnectionState::CONNECTED);
  {
    std::lock_guard<std::mutex> lock(_snapshot_mu);
    _last_hub = hub;
    _has_last_hub = true;
  }
  HhrError session_err;
  if (!_sessions.create_session(hub.id, session_err) && _logger) {
    _logger->log_warn("connection", "session_create_failed", session_err.message);
  }
  if (_logger) _logger->log_info("connection", "connected", "connected to " + hub.friendly_name);
  return true;
}

bool HhrConnectionManager::connect(const HhrHub& hub, HhrError& err) {
  std::lock_guard<std::mutex> lock(_mu);
  return connect_locked(hub, err);
}

bool HhrConnectionManager::disconnect(HhrError& err) {
  std::lock_guard<std::mutex> lock(_mu);
  const bool had = (bool)_transport;
  bool ok = release_locked(err);
  if (had && _logger) _logger->log_info("connection", "disconnected", "disconnected from hub");
  return ok;
}

bool HhrConnectionManager::ensure_connected_locked(HhrError& err) {
  if (!_transport) {
    set_state(HhrConnectionState::DISCONNECTED);
    err = hhr_network_error("not_connected", "Not connected to hub. Please select a hub first.");
    return false;
  }
  DynamicJsonDocument probe(kHhrActivityDocCapacity);
  HhrError probe_err;
  if (_transport->list_activities(probe, probe_err)) {
    set_state(HhrConnectionState::CONNECTED);
    return true;
  }
  if (_logger) _logger->log_warn("connection", "probe_failed", probe_err.message);
  HhrError ignored;
  release_locked(ignored);
  err = hhr_network_error("lost_connection", "Lost connection to hub");
  return false;
}

bool HhrConnectionManager::ensure_connected(HhrError& err) {
  std::lock_guard<std::mutex> lock(_mu);
  return ensure_connected_locked(err);
}

bool HhrConnectionManager::ensure_connected_or_reconnect_locked(HhrError& err) {
  HhrError first;
  if (ensure_connected_locked(first)) return true;

  HhrHub hub;
  if (!last_hub(hub)) {
    err = first;
    return false;
  }
  if (_logger) _logger->log_info("connection", "reconnecting", "reconnecting to " + hub.friendly_name);
  HhrError again;
  if (connect_locked(hub, again)) return true;
  if (_logger) _logger->log_warn("connection", "reconnect_failed", again.message);
  err = first;
  return false;
}

bool HhrConnectionManager::ensure_connected_or_reconnect(HhrError& err) {
  std::lock_guard<std::mutex> lock(_mu);
  return ensure_connected_or_reconnect_locked(err);
}

bool HhrConnectionManager::session_gate_locked(HhrError& err) {
  if (_sessions.validate_session()) return true;
  err = hhr_auth_error("session_expired", "Session expired. Please reconnect to your Hub");
  return false;
}

bool HhrConnectionManager::get_activities_locked(std::vector<HhrActivity>& out, HhrError& err) {
  if (!session_gate_locked(err)) return false;
  if (!_transport) {
    err = hhr_network_error("not_connected", "Not connected to hub");
    return false;
  }

  DynamicJsonDocument doc(kHhrActivityDocCapacity);
  HhrError e;
  if (!_transport->list_activities(doc, e)) {
    err = e;
    if (_logger) _logger->log_error("connection", "activities_failed", e.message);
    return false;
  }

  std::vector<HhrActivity> activities;
  for (JsonVariantConst v : doc.as<JsonArrayConst>()) {
    HhrActivity a;
    if (!hhr_validate_activity_response(v, a, err)) return false;
    activities.push_back(a);
  }
  keep_single_active(activities, _logger);

  StaticJsonDocument<64> extra;
  extra["count"] = (uint32_t)activities.size();
  JsonObjectConst o = extra.as<JsonObjectConst>();
  if (_logger) _logger->log_info("connection", "activities_loaded", "activities fetched", &o);
  out.swap(activities);
  return true;
}

bool HhrConnectionManager::get_devices_locked(std::vector<HhrDevice>& out, HhrError& err) {
  if (!session_gate_locked(err)) return false;
  if (!_transport) {
    err = hhr_network_error("not_connected", "Not connected to hub");
    return false;
  }

  DynamicJsonDocument doc(kHhrDeviceDocCapacity);
  HhrError e;
  if (!_transport->list_devices(doc, e)) {
    err = e;
    if (_logger) _logger->log_error("connection", "devices_failed", e.message);
    return false;
  }

  std::vector<HhrDevice> devices;
  for (JsonVariantConst raw : doc["device"].as<JsonArrayConst>()) {
    HhrDevice dev;
    dev.id = hhr_json_string(raw["id"]);
    dev.label = hhr_json_string(raw["label"]);
    dev.type = hhr_json_string(raw["type"]);
    if (dev.type.empty()) dev.type = hhr_json_string(raw["deviceTypeDisplayName"]);
    if (dev.type.empty()) dev.type = kDefaultDeviceType;

    for (JsonVariantConst group : raw["controlGroup"].as<JsonArrayConst>()) {
      for (JsonVariantConst fn : group["function"].as<JsonArrayConst>()) {
        HhrCommand c;
        c.id = hhr_json_string(fn["name"]);
        c.label = hhr_json_string(fn["label"]);
        if (c.label.empty()) c.label = c.id;
        c.device_id = dev.id;
        dev.commands.push_back(c);
      }
    }

    if (!hhr_validate_device(dev, err)) {
      err.message = "Device response validation failed: " + err.message;
      if (_logger) _logger->log_error("connection", "device_invalid", err.message);
      return false;
    }
    devices.push_back(dev);
  }

  StaticJsonDocument<64> extra;
  extra["count"] = (uint32_t)devices.size();
  JsonObjectConst o = extra.as<JsonObjectConst>();
  if (_logger) _logger->log_info("connection", "devices_loaded", "devices fetched", &o);
  out.swap(devices);
  return true;
}

bool HhrConnectionManager::get_activities(std::vector<HhrActivity>& out, HhrError& err) {
  std::lock_guard<std::mutex> lock(_mu);
  return get_activities_locked(out, err);
}

bool HhrConnectionManager::get_devices(std::vector<HhrDevice>& out, HhrError& err) {
  std::lock_guard<std::mutex> lock(_mu);
  return get_devices_locked(out, err);
}

bool HhrConnectionManager::start_activity(const std::string& activity_id, HhrError& err) {
  std::lock_guard<std::mutex> lock(_mu);
  if (!session_gate_locked(err)) return false;
  if (activity_id.empty()) {
    err = hhr_validation_error("invalid_activity", "Activity ID must be a non-empty string");
    return false;
  }
  if (!_transport) {
    err = hhr_network_error("not_connected", "Not connected to hub");
    return false;
  }
  if (!ensure_connected_or_reconnect_locked(err)) return false;
  if (_logger) _logger->log_info("connection", "activity_starting", "starting activity " + activity_id);
  if (!_transport->start_activity(activity_id, err)) {
    if (_logger) _logger->log_error("connection", "activity_failed", err.message);
    return false;
  }
  if (_logger) _logger->log_info("connection", "activity_started", "activity started " + activity_id);
  return true;
}

bool HhrConnectionManager::press_and_release_locked(const std::string& device_id, const std::string& command_id,
                                                    HhrError& err) {
  if (!ensure_connected_locked(err)) return false;

  HhrHoldAction action;
  action.command = command_id;
  action.device_id = device_id;
  action.status = HhrHoldStatus::PRESS;
  action.timestamp_ms = _clock.now_ms();
  if (!_transport->send_hold_action(action, err)) return false;

  _clock.delay_ms(timing().command_hold_ms);

  action.status = HhrHoldStatus::RELEASE;
  action.timestamp_ms = _clock.now_ms();
  return _transport->send_hold_action(action, err);
}

bool HhrConnectionManager::execute_command(const std::string& device_id, const std::string& command_id,
                                           HhrError& err) {
  std::lock_guard<std::mutex> lock(_mu);
  if (!session_gate_locked(err)) return false;
  if (device_id.empty() || command_id.empty()) {
    err = hhr_validation_error("invalid_command", device_id.empty() ? "Command device ID must be a non-empty string"
                                                                    : "Command ID must be a non-empty string");
    return false;
  }

  _retry_count = 0;
  if (_logger) _logger->log_info("connection", "command_executing", "executing " + command_id + " on " + device_id);

  HhrError last;
  for (uint8_t attempt = 0; attempt < kHhrMaxCommandAttempts; attempt++) {
    last.clear();
    if (press_and_release_locked(device_id, command_id, last)) {
      _retry_count = 0;
      if (_logger) _logger->log_info("connection", "command_executed", "command sent " + command_id);
      return true;
    }
    if (last.category == HhrErrorCategory::VALIDATION) {
      err = last;
      return false;
    }

    _retry_count = (uint8_t)(attempt + 1);
    StaticJsonDocument<128> extra;
    extra["attempt"] = attempt + 1;
    extra["max"] = kHhrMaxCommandAttempts;
    extra["backoff_ms"] = kHhrBackoffScheduleMs[attempt];
    JsonObjectConst o = extra.as<JsonObjectConst>();
    if (_logger) _logger->log_warn("connection", "command_attempt_failed", last.message, &o);

    _clock.delay_ms(kHhrBackoffScheduleMs[attempt]);

    HhrHub hub;
    if (attempt + 1 < kHhrMaxCommandAttempts && last_hub(hub)) {
      HhrError reconnect_err;
      if (!connect_locked(hub, reconnect_err) && _logger) {
        _logger->log_warn("connection", "reconnect_failed", reconnect_err.message);
      }
    }
  }

  if (_logger) _logger->log_error("connection", "command_failed", last.message);
  err = last;
  return false;
}

bool HhrConnectionManager::cache_hub_data(const HhrHub& hub, HhrError& err) {
  std::lock_guard<std::mutex> lock(_mu);
  HhrHub current;
  const bool same_hub = last_hub(current) && current.id == hub.id;
  if (!(_transport && same_hub && state() == HhrConnectionState::CONNECTED)) {
    if (!connect_locked(hub, err)) return false;
  }

  HhrCachedData data;
  data.hub = hub;
  if (!get_activities_locked(data.activities, err)) return false;
  if (!get_devices_locked(data.devices, err)) return false;
  return _cache.save(data, err);
}

bool HhrConnectionManager::clear_cache(HhrError& err) {
  std::lock_guard<std::mutex> lock(_mu);
  HhrError store_err;
  const bool stored = _cache.clear_all(store_err);

  HhrError ignored;
  release_locked(ignored);
  if (_discovery) _discovery->reset_discovered();
  {
    std::lock_guard<std::mutex> snap(_snapshot_mu);
    _last_hub = HhrHub();
    _has_last_hub = false;
  }
  _retry_count = 0;

  if (!stored) {
    err = store_err.category == HhrErrorCategory::CACHE_OPERATION
              ? store_err
              : hhr_cache_error("cache_clear_failed", "Failed to clear cache: " + store_err.message);
    return false;
  }
  if (_logger) _logger->log_info("connection", "cache_cleared", "connection state and cache reset");
  return true;
}
