// src/state_machine/state_machine.h
// Role: Remote UI state machine with a pure transition function and emitted actions.
//
// Canonical states:
// - IDLE
// - LOADING_CACHE
// - DISCOVERING
// - CONNECTING
// - FETCHING_CONFIG
// - CONNECTED
// - DISCONNECTING
//
// hhr_ui_transition() never mutates anything; the orchestrator applies the
// returned actions to its context record. Rejected events leave both state
// and context untouched.

#pragma once

#include <stdint.h>

#include <mutex>
#include <string>
#include <vector>

#include "../hub/hub_error.h"
#include "../hub/hub_types.h"

class HhrEventLogger;

enum class HhrUiState : uint8_t {
  IDLE = 0,
  LOADING_CACHE,
  DISCOVERING,
  CONNECTING,
  FETCHING_CONFIG,
  CONNECTED,
  DISCONNECTING,
};

enum class HhrUiEventType : uint8_t {
  DISCOVER = 0,
  HUB_FOUND,           // payload: hub
  DISCOVERY_COMPLETE,  // payload: hubs
  SELECT_HUB,          // payload: hub
  CONNECT,
  CONNECTED,
  CONFIG_LOADED,       // payload: activities, devices
  LOAD_CACHE,
  CACHE_LOADED,        // payload: hub, activities, devices
  CACHE_EMPTY,
  DISCONNECT,
  DISCONNECTED,
  UPDATE_ACTIVITY,     // payload: activity_id
  EXECUTE_COMMAND,     // payload: device_id, command_id
  ERROR,               // payload: error
};

enum class HhrUiActionType : uint8_t {
  SELECT_HUB = 0,
  ADD_DISCOVERED_HUB,
  RECORD_DISCOVERED_HUBS,
  UPDATE_STATE_FROM_CACHE,
  UPDATE_CONFIG,
  UPDATE_ACTIVITY,
  EXECUTE_COMMAND,
  SET_ERROR,
};

// Tagged event; only the members named for its type are meaningful.
struct HhrUiEvent {
  HhrUiEventType type = HhrUiEventType::DISCOVER;
  HhrHub hub;
  std::vector<HhrHub> hubs;
  std::vector<HhrActivity> activities;
  std::vector<HhrDevice> devices;
  std::string activity_id;
  std::string device_id;
  std::string command_id;
  HhrError error;
};

struct HhrUiContext {
  std::vector<HhrHub> hubs;
  bool has_selected_hub = false;
  HhrHub selected_hub;
  std::vector<HhrActivity> activities;
  std::vector<HhrDevice> devices;
  std::string current_activity_id;  // empty when nothing runs
  std::string last_device_id;
  std::string last_command_id;
  bool has_error = false;
  HhrError error;
};

struct HhrUiTransition {
  bool accepted = false;
  HhrUiState next = HhrUiState::IDLE;
  std::vector<HhrUiActionType> actions;
};

const char* hhr_ui_state_to_string(HhrUiState s);
const char* hhr_ui_event_to_string(HhrUiEventType t);
const char* hhr_ui_action_to_string(HhrUiActionType a);

// Event builders.
HhrUiEvent hhr_ui_event(HhrUiEventType type);
HhrUiEvent hhr_ui_hub_event(HhrUiEventType type, const HhrHub& hub);
HhrUiEvent hhr_ui_hubs_event(const std::vector<HhrHub>& hubs);
HhrUiEvent hhr_ui_config_event(const std::vector<HhrActivity>& activities, const std::vector<HhrDevice>& devices);
HhrUiEvent hhr_ui_cache_event(const HhrCachedData& data);
HhrUiEvent hhr_ui_activity_event(const std::string& activity_id);
HhrUiEvent hhr_ui_command_event(const std::string& device_id, const std::string& command_id);
HhrUiEvent hhr_ui_error_event(const HhrError& err);

// Pure: reads `ctx` only for guards.
HhrUiTransition hhr_ui_transition(HhrUiState state, const HhrUiContext& ctx, const HhrUiEvent& ev);

// Mutates the context record only.
void hhr_ui_apply_action(HhrUiActionType action, const HhrUiEvent& ev, HhrUiContext& ctx);

// Owns the current state + context and serializes event delivery.
class HhrStateOrchestrator {
 public:
  explicit HhrStateOrchestrator(HhrEventLogger* logger) : _logger(logger) {}

  // Returns false (and logs) when the current state does not accept `ev`.
  bool send(const HhrUiEvent& ev);

  HhrUiState state() const;
  HhrUiContext context() const;
  void snapshot(HhrUiState& state, HhrUiContext& ctx) const;

 private:
  HhrEventLogger* _logger;
  mutable std::mutex _mu;
  HhrUiState _state = HhrUiState::IDLE;
  HhrUiContext _ctx;
};
