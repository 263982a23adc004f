// src/state_machine/state_machine.cpp
// Role: Remote UI state machine with a pure transition function and emitted actions.

#include "state_machine.h"

#include <ArduinoJson.h>

#include "../logging/event_logger.h"

const char* hhr_ui_state_to_string(HhrUiState s) {
  switch (s) {
    case HhrUiState::IDLE: return "IDLE";
    case HhrUiState::LOADING_CACHE: return "LOADING_CACHE";
    case HhrUiState::DISCOVERING: return "DISCOVERING";
    case HhrUiState::CONNECTING: return "CONNECTING";
    case HhrUiState::FETCHING_CONFIG: return "FETCHING_CONFIG";
    case HhrUiState::CONNECTED: return "CONNECTED";
    case HhrUiState::DISCONNECTING: return "DISCONNECTING";
  }
  return "IDLE";
}

const char* hhr_ui_event_to_string(HhrUiEventType t) {
  switch (t) {
    case HhrUiEventType::DISCOVER: return "DISCOVER";
    case HhrUiEventType::HUB_FOUND: return "HUB_FOUND";
    case HhrUiEventType::DISCOVERY_COMPLETE: return "DISCOVERY_COMPLETE";
    case HhrUiEventType::SELECT_HUB: return "SELECT_HUB";
    case HhrUiEventType::CONNECT: return "CONNECT";
    case HhrUiEventType::CONNECTED: return "CONNECTED";
    case HhrUiEventType::CONFIG_LOADED: return "CONFIG_LOADED";
    case HhrUiEventType::LOAD_CACHE: return "LOAD_CACHE";
    case HhrUiEventType::CACHE_LOADED: return "CACHE_LOADED";
    case HhrUiEventType::CACHE_EMPTY: return "CACHE_EMPTY";
    case HhrUiEventType::DISCONNECT: return "DISCONNECT";
    case HhrUiEventType::DISCONNECTED: return "DISCONNECTED";
    case HhrUiEventType::UPDATE_ACTIVITY: return "UPDATE_ACTIVITY";
    case HhrUiEventType::EXECUTE_COMMAND: return "EXECUTE_COMMAND";
    case HhrUiEventType::ERROR: return "ERROR";
  }
  return "ERROR";
}

const char* hhr_ui_action_to_string(HhrUiActionType a) {
  switch (a) {
    case HhrUiActionType::SELECT_HUB: return "SELECT_HUB";
    case HhrUiActionType::ADD_DISCOVERED_HUB: return "ADD_DISCOVERED_HUB";
    case HhrUiActionType::RECORD_DISCOVERED_HUBS: return "RECORD_DISCOVERED_HUBS";
    case HhrUiActionType::UPDATE_STATE_FROM_CACHE: return "UPDATE_STATE_FROM_CACHE";
    case HhrUiActionType::UPDATE_CONFIG: return "UPDATE_CONFIG";
    case HhrUiActionType::UPDATE_ACTIVITY: return "UPDATE_ACTIVITY";
    case HhrUiActionType::EXECUTE_COMMAND: return "EXECUTE_COMMAND";
    case HhrUiActionType::SET_ERROR: return "SET_ERROR";
  }
  return "SET_ERROR";
}

HhrUiEvent hhr_ui_event(HhrUiEventType type) {
  HhrUiEvent ev;
  ev.type = type;
  return ev;
}

HhrUiEvent hhr_ui_hub_event(HhrUiEventType type, const HhrHub& hub) {
  HhrUiEvent ev = hhr_ui_event(type);
  ev.hub = hub;
  return ev;
}

HhrUiEvent hhr_ui_hubs_event(const std::vector<HhrHub>& hubs) {
  HhrUiEvent ev = hhr_ui_event(HhrUiEventType::DISCOVERY_COMPLETE);
  ev.hubs = hubs;
  return ev;
}

HhrUiEvent hhr_ui_config_event(const std::vector<HhrActivity>& activities, const std::vector<HhrDevice>& devices) {
  HhrUiEvent ev = hhr_ui_event(HhrUiEventType::CONFIG_LOADED);
  ev.activities = activities;
  ev.devices = devices;
  return ev;
}

HhrUiEvent hhr_ui_cache_event(const HhrCachedData& data) {
  HhrUiEvent ev = hhr_ui_event(HhrUiEventType::CACHE_LOADED);
  ev.hub = data.hub;
  ev.activities = data.activities;
  ev.devices = data.devices;
  return ev;
}

HhrUiEvent hhr_ui_activity_event(const std::string& activity_id) {
  HhrUiEvent ev = hhr_ui_event(HhrUiEventType::UPDATE_ACTIVITY);
  ev.activity_id = activity_id;
  return ev;
}

HhrUiEvent hhr_ui_command_event(const std::string& device_id, const std::string& command_id) {
  HhrUiEvent ev = hhr_ui_event(HhrUiEventType::EXECUTE_COMMAND);
  ev.device_id = device_id;
  ev.command_id = command_id;
  return ev;
}

HhrUiEvent hhr_ui_error_event(const HhrError& err) {
  HhrUiEvent ev = hhr_ui_event(HhrUiEventType::ERROR);
  ev.error = err;
  return ev;
}

static HhrUiTransition accept(HhrUiState next) {
  HhrUiTransition t;
  t.accepted = true;
  t.next = next;
  return t;
}

static HhrUiTransition accept(HhrUiState next, HhrUiActionType action) {
  HhrUiTransition t = accept(next);
  t.actions.push_back(action);
  return t;
}

HhrUiTransition hhr_ui_transition(HhrUiState state, const HhrUiContext& ctx, const HhrUiEvent& ev) {
  // ERROR is accepted everywhere and always lands in IDLE.
  if (ev.type == HhrUiEventType::ERROR) {
    return accept(HhrUiState::IDLE, HhrUiActionType::SET_ERROR);
  }

  switch (state) {
    case HhrUiState::IDLE:
      switch (ev.type) {
        case HhrUiEventType::DISCOVER: return accept(HhrUiState::DISCOVERING);
        case HhrUiEventType::LOAD_CACHE: return accept(HhrUiState::LOADING_CACHE);
        case HhrUiEventType::SELECT_HUB:
          if (ev.hub.id.empty()) break;
          return accept(HhrUiState::IDLE, HhrUiActionType::SELECT_HUB);
        case HhrUiEventType::CONNECT:
          if (!ctx.has_selected_hub) break;
          return accept(HhrUiState::CONNECTING);
        default: break;
      }
      break;

    case HhrUiState::LOADING_CACHE:
      if (ev.type == HhrUiEventType::CACHE_LOADED) {
        return accept(HhrUiState::CONNECTED, HhrUiActionType::UPDATE_STATE_FROM_CACHE);
      }
      if (ev.type == HhrUiEventType::CACHE_EMPTY) return accept(HhrUiState::IDLE);
      break;

    case HhrUiState::DISCOVERING:
      if (ev.type == HhrUiEventType::HUB_FOUND) {
        return accept(HhrUiState::IDLE, HhrUiActionType::ADD_DISCOVERED_HUB);
      }
      if (ev.type == HhrUiEventType::DISCOVERY_COMPLETE) {
        return accept(HhrUiState::IDLE, HhrUiActionType::RECORD_DISCOVERED_HUBS);
      }
      break;

    case HhrUiState::CONNECTING:
      if (ev.type == HhrUiEventType::CONNECTED) return accept(HhrUiState::FETCHING_CONFIG);
      break;

    case HhrUiState::FETCHING_CONFIG:
      if (ev.type == HhrUiEventType::CONFIG_LOADED) {
        return accept(HhrUiState::CONNECTED, HhrUiActionType::UPDATE_CONFIG);
      }
      break;

    case HhrUiState::CONNECTED:
      if (ev.type == HhrUiEventType::DISCONNECT) return accept(HhrUiState::DISCONNECTING);
      if (ev.type == HhrUiEventType::UPDATE_ACTIVITY) {
        return accept(HhrUiState::CONNECTED, HhrUiActionType::UPDATE_ACTIVITY);
      }
      if (ev.type == HhrUiEventType::EXECUTE_COMMAND) {
        return accept(HhrUiState::CONNECTED, HhrUiActionType::EXECUTE_COMMAND);
      }
      break;

    case HhrUiState::DISCONNECTING:
      if (ev.type == HhrUiEventType::DISCONNECTED) return accept(HhrUiState::IDLE);
      break;
  }

  HhrUiTransition rejected;
  rejected.next = state;
  return rejected;
}

static void mark_active(std::vector<HhrActivity>& activities, const std::string& id) {
  for (auto& a : activities) {
    a.is_active = (a.id == id);
  }
}

static std::string find_active(const std::vector<HhrActivity>& activities) {
  for (const auto& a : activities) {
    if (a.is_active) return a.id;
  }
  return std::string();
}

void hhr_ui_apply_action(HhrUiActionType action, const HhrUiEvent& ev, HhrUiContext& ctx) {
  switch (action) {
    case HhrUiActionType::SELECT_HUB:
      ctx.selected_hub = ev.hub;
      ctx.has_selected_hub = true;
      break;

    case HhrUiActionType::ADD_DISCOVERED_HUB: {
      for (const auto& h : ctx.hubs) {
        if (h.id == ev.hub.id) return;
      }
      ctx.hubs.push_back(ev.hub);
      break;
    }

    case HhrUiActionType::RECORD_DISCOVERED_HUBS:
      ctx.hubs = ev.hubs;
      break;

    case HhrUiActionType::UPDATE_STATE_FROM_CACHE:
      ctx.selected_hub = ev.hub;
      ctx.has_selected_hub = true;
      ctx.activities = ev.activities;
      ctx.devices = ev.devices;
      ctx.current_activity_id = find_active(ctx.activities);
      break;

    case HhrUiActionType::UPDATE_CONFIG:
      ctx.activities = ev.activities;
      ctx.devices = ev.devices;
      ctx.current_activity_id = find_active(ctx.activities);
      break;

    case HhrUiActionType::UPDATE_ACTIVITY:
      mark_active(ctx.activities, ev.activity_id);
      ctx.current_activity_id = ev.activity_id;
      break;

    case HhrUiActionType::EXECUTE_COMMAND:
      ctx.last_device_id = ev.device_id;
      ctx.last_command_id = ev.command_id;
      break;

    case HhrUiActionType::SET_ERROR:
      ctx.error = ev.error;
      ctx.has_error = true;
      break;
  }
}

bool HhrStateOrchestrator::send(const HhrUiEvent& ev) {
  std::lock_guard<std::mutex> lock(_mu);
  HhrUiTransition t = hhr_ui_transition(_state, _ctx, ev);
  if (!t.accepted) {
    if (_logger) {
      StaticJsonDocument<128> extra;
      extra["state"] = hhr_ui_state_to_string(_state);
      extra["event"] = hhr_ui_event_to_string(ev.type);
      JsonObjectConst o = extra.as<JsonObjectConst>();
      _logger->log_warn("ui", "event_rejected", "event not accepted in current state", &o);
    }
    return false;
  }

  for (size_t i = 0; i < t.actions.size(); i++) {
    hhr_ui_apply_action(t.actions[i], ev, _ctx);
  }

  if (_logger) {
    StaticJsonDocument<160> extra;
    extra["from"] = hhr_ui_state_to_string(_state);
    extra["to"] = hhr_ui_state_to_string(t.next);
    extra["event"] = hhr_ui_event_to_string(ev.type);
    JsonObjectConst o = extra.as<JsonObjectConst>();
    if (ev.type == HhrUiEventType::ERROR) {
      _logger->log_error("ui", "ui_error", ev.error.message, &o);
    } else {
      _logger->log_debug("ui", "ui_transition", "state transition", &o);
    }
  }
  _state = t.next;
  return true;
}

HhrUiState HhrStateOrchestrator::state() const {
  std::lock_guard<std::mutex> lock(_mu);
  return _state;
}

HhrUiContext HhrStateOrchestrator::context() const {
  std::lock_guard<std::mutex> lock(_mu);
  return _ctx;
}

void HhrStateOrchestrator::snapshot(HhrUiState& state, HhrUiContext& ctx) const {
  std::lock_guard<std::mutex> lock(_mu);
  state = _state;
  ctx = _ctx;
}
