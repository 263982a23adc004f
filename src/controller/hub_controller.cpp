// src/controller/hub_controller.cpp
// Role: Control flows behind the HTTP API: request queue, UI events, engine calls, cache writes.

#include "hub_controller.h"

#include <ArduinoJson.h>
#include <stdio.h>

const char* hhr_request_type_to_string(HhrRequestType t) {
  switch (t) {
    case HhrRequestType::DISCOVER: return "discover";
    case HhrRequestType::CONNECT: return "connect";
    case HhrRequestType::DISCONNECT: return "disconnect";
    case HhrRequestType::LOAD_CACHE: return "load_cache";
    case HhrRequestType::START_ACTIVITY: return "start_activity";
    case HhrRequestType::EXECUTE_COMMAND: return "execute_command";
    case HhrRequestType::CLEAR_CACHE: return "clear_cache";
  }
  return "unknown";
}

bool HhrHubController::enqueue(const HhrRequest& req, HhrError& err) {
  std::lock_guard<std::mutex> lock(_mu);
  if (_queue.size() >= kHhrMaxPendingRequests) {
    err = hhr_unknown_error("queue_full", "Too many pending requests");
    return false;
  }
  _queue.push_back(req);
  if (_logger) _logger->log_debug("controller", "request_queued", hhr_request_type_to_string(req.type));
  return true;
}

size_t HhrHubController::run_pending() {
  size_t ran = 0;
  for (;;) {
    HhrRequest req;
    {
      std::lock_guard<std::mutex> lock(_mu);
      if (_queue.empty()) break;
      req = _queue.front();
      _queue.pop_front();
      _busy = true;
    }

    HhrError err;
    bool ok = run(req, err);
    ran++;

    std::lock_guard<std::mutex> lock(_mu);
    _busy = false;
    _has_last = true;
    _last_type = req.type;
    _last_ok = ok;
    _last_error = ok ? HhrError() : err;
  }
  return ran;
}

HhrControllerStatus HhrHubController::status() const {
  std::lock_guard<std::mutex> lock(_mu);
  HhrControllerStatus s;
  s.pending = _queue.size();
  s.busy = _busy;
  s.has_last = _has_last;
  s.last_type = _last_type;
  s.last_ok = _last_ok;
  s.last_error = _last_error;
  return s;
}

bool HhrHubController::run(const HhrRequest& req, HhrError& err) {
  switch (req.type) {
    case HhrRequestType::DISCOVER: return discover(err);
    case HhrRequestType::CONNECT: return connect_selected(err);
    case HhrRequestType::DISCONNECT: return disconnect(err);
    case HhrRequestType::LOAD_CACHE: return load_cache(err);
    case HhrRequestType::START_ACTIVITY: return start_activity(req.activity_id, err);
    case HhrRequestType::EXECUTE_COMMAND: return execute_command(req.device_id, req.command_id, err);
    case HhrRequestType::CLEAR_CACHE: return clear_cache(err);
  }
  err = hhr_unknown_error("unknown_request", "Unknown request");
  return false;
}

bool HhrHubController::fail(const HhrError& err, const char* source, bool reset_ui) {
  _errors.handle(err, source);
  if (reset_ui) _ui.send(hhr_ui_error_event(err));
  return false;
}

bool HhrHubController::invalid_state(const char* what, HhrError& err) {
  char msg[96];
  snprintf(msg, sizeof(msg), "Cannot %s while %s", what, hhr_ui_state_to_string(_ui.state()));
  err = hhr_validation_error("invalid_state", msg);
  _errors.handle(err, "controller");
  return false;
}

bool HhrHubController::select_hub(const std::string& hub_id, HhrError& err) {
  std::vector<HhrHub> hubs = _discovery.discovered();
  for (const auto& h : hubs) {
    if (h.id != hub_id) continue;
    if (!_ui.send(hhr_ui_hub_event(HhrUiEventType::SELECT_HUB, h))) return invalid_state("select a hub", err);
    if (_logger) _logger->log_info("controller", "hub_selected", "selected hub " + h.friendly_name);
    return true;
  }
  err = hhr_validation_error("unknown_hub", "Hub not found in discovery results");
  return fail(err, "controller", false);
}

bool HhrHubController::discover(HhrError& err) {
  if (!_ui.send(hhr_ui_event(HhrUiEventType::DISCOVER))) return invalid_state("discover", err);

  std::vector<HhrHub> hubs;
  if (!_discovery.discover_hubs(hubs, err)) return fail(err, "discovery", true);

  _ui.send(hhr_ui_hubs_event(hubs));
  if (hubs.empty()) {
    _notifier.warning("No Hubs Found", "Make sure your Harmony Hub is on the same network");
  } else {
    char msg[48];
    snprintf(msg, sizeof(msg), "Found %u hub(s)", (unsigned)hubs.size());
    _notifier.success("Discovery Complete", msg);
  }
  return true;
}

bool HhrHubController::connect_selected(HhrError& err) {
  if (!_ui.send(hhr_ui_event(HhrUiEventType::CONNECT))) return invalid_state("connect", err);
  HhrUiContext ctx = _ui.context();
  const HhrHub hub = ctx.selected_hub;

  if (!_connection.connect(hub, err)) return fail(err, "connection", true);
  _ui.send(hhr_ui_event(HhrUiEventType::CONNECTED));

  HhrCachedData data;
  data.hub = hub;
  if (!_connection.get_activities(data.activities, err) || !_connection.get_devices(data.devices, err)) {
    HhrError ignored;
    _connection.disconnect(ignored);
    return fail(err, "connection", true);
  }
  _ui.send(hhr_ui_config_event(data.activities, data.devices));

  HhrError cache_err;
  if (!_cache.save(data, cache_err)) _errors.handle(cache_err, "cache");

  _errors.note_success();
  _notifier.success("Connected", "Connected to " + hub.friendly_name);
  return true;
}

bool HhrHubController::load_cache(HhrError& err) {
  if (!_ui.send(hhr_ui_event(HhrUiEventType::LOAD_CACHE))) return invalid_state("load the cache", err);

  HhrCachedData data;
  bool found = false;
  const int64_t max_age_ms = (int64_t)_cache_duration_s.load() * 1000;
  if (!_cache.load(max_age_ms, data, found, err)) return fail(err, "cache", true);
  if (!found) {
    _ui.send(hhr_ui_event(HhrUiEventType::CACHE_EMPTY));
    return true;
  }

  // Cached data only seeds the UI; the hub must still answer live.
  if (!_connection.connect(data.hub, err)) return fail(err, "connection", true);
  _ui.send(hhr_ui_cache_event(data));
  _errors.note_success();
  _notifier.success("Connected", "Loaded cached data for " + data.hub.friendly_name);
  return true;
}

bool HhrHubController::start_activity(const std::string& activity_id, HhrError& err) {
  if (_ui.state() != HhrUiState::CONNECTED) return invalid_state("start an activity", err);

  if (!_connection.start_activity(activity_id, err)) {
    const bool lost = err.category == HhrErrorCategory::AUTHENTICATION ||
                      _connection.state() != HhrConnectionState::CONNECTED;
    return fail(err, "connection", lost);
  }
  _ui.send(hhr_ui_activity_event(activity_id));
  _errors.note_success();
  _notifier.success("Activity Started", activity_id);
  return true;
}

bool HhrHubController::execute_command(const std::string& device_id, const std::string& command_id, HhrError& err) {
  if (_ui.state() != HhrUiState::CONNECTED) return invalid_state("execute a command", err);

  if (!_connection.execute_command(device_id, command_id, err)) {
    const bool lost = err.category == HhrErrorCategory::AUTHENTICATION ||
                      _connection.state() != HhrConnectionState::CONNECTED;
    return fail(err, "connection", lost);
  }
  _ui.send(hhr_ui_command_event(device_id, command_id));
  _errors.note_success();
  _notifier.success("Command Sent", command_id);
  return true;
}

bool HhrHubController::disconnect(HhrError& err) {
  const bool ui_connected =
      _ui.state() == HhrUiState::CONNECTED && _ui.send(hhr_ui_event(HhrUiEventType::DISCONNECT));
  bool ok = _connection.disconnect(err);
  if (ui_connected) _ui.send(hhr_ui_event(HhrUiEventType::DISCONNECTED));
  if (!ok) return fail(err, "connection", false);
  _notifier.success("Disconnected");
  return true;
}

bool HhrHubController::clear_cache(HhrError& err) {
  bool ok = _connection.clear_cache(err);
  if (_ui.state() == HhrUiState::CONNECTED && _ui.send(hhr_ui_event(HhrUiEventType::DISCONNECT))) {
    _ui.send(hhr_ui_event(HhrUiEventType::DISCONNECTED));
  }
  if (!ok) return fail(err, "cache", false);
  _errors.note_success();
  _notifier.success("Cache Cleared", "Hub data and session removed");
  return true;
}
