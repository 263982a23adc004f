// src/controller/hub_controller.h
// Role: Control flows behind the HTTP API: request queue, UI events, engine calls, cache writes.
#pragma once

#include <stdint.h>

#include <atomic>
#include <deque>
#include <mutex>
#include <string>

#include "../connection/connection_manager.h"
#include "../discovery/discovery_engine.h"
#include "../hub/error_dispatcher.h"
#include "../hub/hub_error.h"
#include "../logging/event_logger.h"
#include "../notify/notifier.h"
#include "../state_machine/state_machine.h"
#include "../storage/cache_store.h"

enum class HhrRequestType : uint8_t {
  DISCOVER = 0,
  CONNECT,
  DISCONNECT,
  LOAD_CACHE,
  START_ACTIVITY,
  EXECUTE_COMMAND,
  CLEAR_CACHE,
};

const char* hhr_request_type_to_string(HhrRequestType t);

static const size_t kHhrMaxPendingRequests = 8;

struct HhrRequest {
  HhrRequestType type = HhrRequestType::DISCOVER;
  std::string activity_id;
  std::string device_id;
  std::string command_id;
};

struct HhrControllerStatus {
  size_t pending = 0;
  bool busy = false;
  bool has_last = false;
  HhrRequestType last_type = HhrRequestType::DISCOVER;
  bool last_ok = false;
  HhrError last_error;
};

// Long operations are queued by the HTTP handlers and executed by one worker
// (run_pending). Every failure is routed through the error dispatcher; the UI
// state machine falls back to IDLE when the failure left no usable
// connection or invalidated the session.
class HhrHubController {
 public:
  HhrHubController(HhrConnectionManager& connection, HhrDiscoveryEngine& discovery, HhrCacheStore& cache,
                   HhrStateOrchestrator& ui, HhrErrorDispatcher& errors, HhrNotifier& notifier,
                   HhrEventLogger* logger)
      : _connection(connection), _discovery(discovery), _cache(cache), _ui(ui), _errors(errors),
        _notifier(notifier), _logger(logger) {}

  // 0 disables the age limit for cache-first loading.
  void set_cache_duration_s(uint32_t seconds) { _cache_duration_s = seconds; }

  // Fails with UNKNOWN/queue_full when kHhrMaxPendingRequests are waiting.
  bool enqueue(const HhrRequest& req, HhrError& err);

  // Executes every queued request in order. Returns how many ran.
  size_t run_pending();

  HhrControllerStatus status() const;

  // Immediate (not queued): picks a hub from the last discovery result.
  bool select_hub(const std::string& hub_id, HhrError& err);

  // Flows; also callable directly (tests, boot).
  bool discover(HhrError& err);
  bool connect_selected(HhrError& err);
  bool load_cache(HhrError& err);
  bool start_activity(const std::string& activity_id, HhrError& err);
  bool execute_command(const std::string& device_id, const std::string& command_id, HhrError& err);
  bool disconnect(HhrError& err);
  bool clear_cache(HhrError& err);

 private:
  bool run(const HhrRequest& req, HhrError& err);
  bool fail(const HhrError& err, const char* source, bool reset_ui);
  bool invalid_state(const char* what, HhrError& err);

  HhrConnectionManager& _connection;
  HhrDiscoveryEngine& _discovery;
  HhrCacheStore& _cache;
  HhrStateOrchestrator& _ui;
  HhrErrorDispatcher& _errors;
  HhrNotifier& _notifier;
  HhrEventLogger* _logger;
  std::atomic<uint32_t> _cache_duration_s{3600};

  mutable std::mutex _mu;
  std::deque<HhrRequest> _queue;
  bool _busy = false;
  bool _has_last = false;
  HhrRequestType _last_type = HhrRequestType::DISCOVER;
  bool _last_ok = false;
  HhrError _last_error;
};
