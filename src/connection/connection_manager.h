// src/connection/connection_manager.h
// Role: Owns the single hub connection: connect/probe/reconnect, queries, retried commands.
#pragma once

#include <stdint.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../discovery/discovery_engine.h"
#include "../hub/hub_error.h"
#include "../hub/hub_types.h"
#include "../logging/event_logger.h"
#include "../platform/clock.h"
#include "../session/session_store.h"
#include "../storage/cache_store.h"
#include "hub_transport.h"

static const uint8_t kHhrMaxCommandAttempts = 3;
static const uint32_t kHhrBackoffScheduleMs[kHhrMaxCommandAttempts] = {1000, 2000, 4000};

// JSON capacities for hub responses.
static const size_t kHhrActivityDocCapacity = 8192;
static const size_t kHhrDeviceDocCapacity = 49152;

// DISCONNECTED --connect--> CONNECTING --probe ok--> CONNECTED
// CONNECTED --probe fails--> DISCONNECTED; any --disconnect--> DISCONNECTED
//
// Every public operation is serialized by one mutex. state(), retry_count()
// and has_transport() are lock-free snapshots for status readers.
class HhrConnectionManager : public HhrHubPrefetcher {
 public:
  HhrConnectionManager(HhrTransportFactory& factory, HhrSessionStore& sessions, HhrCacheStore& cache,
                       HhrClock& clock, HhrEventLogger* logger)
      : _factory(factory), _sessions(sessions), _cache(cache), _clock(clock), _logger(logger) {}

  void set_timing(const HhrConnectionTiming& timing);
  HhrConnectionTiming timing() const;

  // clear_cache() also resets the engine's discovered list.
  void attach_discovery(HhrDiscoveryEngine* discovery);

  // Replaces any existing connection. On success the hub becomes the last
  // known hub and a session is created with the hub id as token.
  bool connect(const HhrHub& hub, HhrError& err);

  // Always ends DISCONNECTED without a handle; a failed graceful close is
  // reported afterwards.
  bool disconnect(HhrError& err);

  // Probes the live handle. Failure releases it.
  bool ensure_connected(HhrError& err);

  // ensure_connected() plus one reconnect attempt to the last known hub.
  // Surfaces the original failure when the reconnect fails too.
  bool ensure_connected_or_reconnect(HhrError& err);

  // Session-gated queries. At most one returned activity is active.
  bool get_activities(std::vector<HhrActivity>& out, HhrError& err);
  bool get_devices(std::vector<HhrDevice>& out, HhrError& err);
  // Checks a live handle first and reconnects once when it does not answer.
  bool start_activity(const std::string& activity_id, HhrError& err);

  // Session-gated press/hold/release with up to kHhrMaxCommandAttempts tries.
  bool execute_command(const std::string& device_id, const std::string& command_id, HhrError& err);

  // Connects to `hub` when needed, then writes its activities/devices to the cache.
  bool cache_hub_data(const HhrHub& hub, HhrError& err) override;

  // Removes every hub-related key and resets all in-memory connection state.
  bool clear_cache(HhrError& err);

  HhrConnectionState state() const { return _state.load(); }
  bool has_transport() const { return _has_transport.load(); }
  uint8_t retry_count() const { return _retry_count.load(); }
  bool last_hub(HhrHub& out) const;

 private:
  bool connect_locked(const HhrHub& hub, HhrError& err);
  bool release_locked(HhrError& err);
  bool ensure_connected_locked(HhrError& err);
  bool ensure_connected_or_reconnect_locked(HhrError& err);
  bool session_gate_locked(HhrError& err);
  bool get_activities_locked(std::vector<HhrActivity>& out, HhrError& err);
  bool get_devices_locked(std::vector<HhrDevice>& out, HhrError& err);
  bool press_and_release_locked(const std::string& device_id, const std::string& command_id, HhrError& err);
  void set_state(HhrConnectionState s);

  HhrTransportFactory& _factory;
  HhrSessionStore& _sessions;
  HhrCacheStore& _cache;
  HhrClock& _clock;
  HhrEventLogger* _logger;
  HhrDiscoveryEngine* _discovery = nullptr;

  mutable std::mutex _mu;
  // Guards _timing only; never held across hub I/O.
  mutable std::mutex _timing_mu;
  HhrConnectionTiming _timing;
  std::unique_ptr<HhrHubTransport> _transport;
  bool _has_last_hub = false;
  HhrHub _last_hub;

  std::atomic<HhrConnectionState> _state{HhrConnectionState::DISCONNECTED};
  std::atomic<bool> _has_transport{false};
  std::atomic<uint8_t> _retry_count{0};

  // Guards _last_hub for last_hub() readers that do not take _mu.
  mutable std::mutex _snapshot_mu;
};
