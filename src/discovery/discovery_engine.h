// src/discovery/discovery_engine.h
// Role: Single-flight, bounded-window hub discovery with dedup by hub id.
#pragma once

#include <stdint.h>

#include <condition_variable>
#include <mutex>
#include <vector>

#include "../hub/hub_error.h"
#include "../hub/hub_types.h"
#include "../logging/event_logger.h"
#include "../platform/clock.h"
#include "discovery_listener.h"

static const uint16_t kHhrDefaultDiscoveryPort = 61991;
static const uint8_t kHhrDiscoveryPortFallbacks = 4;  // 61992..61995

struct HhrDiscoveryOptions {
  uint16_t base_port = kHhrDefaultDiscoveryPort;
  uint8_t port_fallbacks = kHhrDiscoveryPortFallbacks;
  uint32_t window_ms = 60000;
  uint32_t poll_interval_ms = 100;
};

struct HhrDiscoveryStatus {
  bool in_flight = false;
  uint32_t waiters = 0;
  uint32_t runs = 0;
  size_t discovered = 0;
};

// Fetches and caches a hub's activities/devices (implemented by the
// connection manager).
class HhrHubPrefetcher {
 public:
  virtual ~HhrHubPrefetcher() {}
  virtual bool cache_hub_data(const HhrHub& hub, HhrError& err) = 0;
};

// Scoped listener acquisition: the destructor stops the listener, so every
// exit from a discovery run releases socket, timers and the event sink.
class HhrDiscoverySession : public HhrDiscoveryEvents {
 public:
  HhrDiscoverySession(HhrDiscoveryListener& listener, HhrEventLogger* logger)
      : _listener(listener), _logger(logger) {}
  ~HhrDiscoverySession() override;

  HhrDiscoverySession(const HhrDiscoverySession&) = delete;
  HhrDiscoverySession& operator=(const HhrDiscoverySession&) = delete;

  // Tries base_port, then the fallbacks, while the listener reports port_in_use.
  bool open(const HhrDiscoveryOptions& opts, HhrError& err);
  void poll();

  // True once the listener reported a terminal error (copied into `err`).
  bool failed(HhrError& err) const;

  const std::vector<HhrHub>& hubs() const { return _hubs; }
  uint16_t port() const { return _port; }

  void on_hub_online(JsonObjectConst descriptor) override;
  void on_error(const HhrError& err) override;

 private:
  HhrDiscoveryListener& _listener;
  HhrEventLogger* _logger;
  bool _started = false;
  uint16_t _port = 0;
  bool _failed = false;
  HhrError _error;
  std::vector<HhrHub> _hubs;
};

class HhrDiscoveryEngine {
 public:
  HhrDiscoveryEngine(HhrDiscoveryListener& listener, HhrClock& clock, HhrEventLogger* logger)
      : _listener(listener), _clock(clock), _logger(logger) {}

  void set_options(const HhrDiscoveryOptions& opts);
  HhrDiscoveryOptions options() const;

  // Optional; receives the first hub of every successful non-empty run.
  void set_prefetcher(HhrHubPrefetcher* prefetcher);

  // Runs one discovery window. Callers arriving while a run is in flight wait
  // for it and receive the same result; no second listener is started.
  bool discover_hubs(std::vector<HhrHub>& out, HhrError& err);

  // Last successful result.
  std::vector<HhrHub> discovered() const;
  void reset_discovered();

  HhrDiscoveryStatus status() const;

 private:
  bool run_window(const HhrDiscoveryOptions& opts, std::vector<HhrHub>& out, HhrError& err);
  void prefetch_first(const std::vector<HhrHub>& hubs);

  HhrDiscoveryListener& _listener;
  HhrClock& _clock;
  HhrEventLogger* _logger;

  mutable std::mutex _mu;
  std::condition_variable _cv;
  HhrDiscoveryOptions _opts;
  HhrHubPrefetcher* _prefetcher = nullptr;
  bool _in_flight = false;
  uint32_t _generation = 0;
  uint32_t _waiters = 0;
  uint32_t _runs = 0;

  // Result of the most recent run, handed to its waiters.
  bool _last_ok = false;
  std::vector<HhrHub> _last_hubs;
  HhrError _last_error;

  std::vector<HhrHub> _discovered;
};
