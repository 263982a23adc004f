// src/discovery/discovery_engine.cpp
// Role: Single-flight, bounded-window hub discovery with dedup by hub id.

#include "discovery_engine.h"

#include "../hub/validator.h"

HhrDiscoverySession::~HhrDiscoverySession() {
  if (_started) {
    _listener.stop();
    if (_logger) _logger->log_debug("discovery", "listener_stopped", "discovery listener released");
  }
}

bool HhrDiscoverySession::open(const HhrDiscoveryOptions& opts, HhrError& err) {
  const uint32_t last = (uint32_t)opts.base_port + opts.port_fallbacks;
  for (uint32_t p = opts.base_port; p <= last && p <= 65535; p++) {
    HhrError e;
    if (_listener.start((uint16_t)p, this, e)) {
      _started = true;
      _port = (uint16_t)p;
      StaticJsonDocument<64> extra;
      extra["port"] = _port;
      JsonObjectConst o = extra.as<JsonObjectConst>();
      if (_logger) _logger->log_info("discovery", "listener_started", "discovery listener started", &o);
      return true;
    }
    if (e.code != "port_in_use") {
      err = e;
      return false;
    }
    if (_logger) _logger->log_warn("discovery", "port_in_use", "discovery port busy, trying next");
  }
  err = hhr_network_error("port_in_use", "All ports in use. Please try again later.");
  return false;
}

void HhrDiscoverySession::poll() {
  if (_started && !_failed) _listener.poll();
}

bool HhrDiscoverySession::failed(HhrError& err) const {
  if (_failed) err = _error;
  return _failed;
}

void HhrDiscoverySession::on_hub_online(JsonObjectConst descriptor) {
  HhrHub hub;
  HhrError err;
  if (!hhr_validate_hub_response(descriptor, hub, err)) {
    if (_logger) _logger->log_warn("discovery", "announcement_invalid", err.message);
    return;
  }
  for (const auto& h : _hubs) {
    if (h.id == hub.id) return;
  }
  _hubs.push_back(hub);
  if (_logger) _logger->log_info("discovery", "hub_found", "found hub " + hub.friendly_name + " at " + hub.ip);
}

void HhrDiscoverySession::on_error(const HhrError& err) {
  if (_failed) return;
  _failed = true;
  _error = err;
  if (_error.ok()) _error = hhr_network_error("discovery_failed", "Discovery listener failed");
  if (_logger) _logger->log_error("discovery", "listener_error", _error.message);
}

void HhrDiscoveryEngine::set_options(const HhrDiscoveryOptions& opts) {
  std::lock_guard<std::mutex> lock(_mu);
  _opts = opts;
}

HhrDiscoveryOptions HhrDiscoveryEngine::options() const {
  std::lock_guard<std::mutex> lock(_mu);
  return _opts;
}

void HhrDiscoveryEngine::set_prefetcher(HhrHubPrefetcher* prefetcher) {
  std::lock_guard<std::mutex> lock(_mu);
  _prefetcher = prefetcher;
}

bool HhrDiscoveryEngine::run_window(const HhrDiscoveryOptions& opts, std::vector<HhrHub>& out, HhrError& err) {
  HhrDiscoverySession session(_listener, _logger);
  if (!session.open(opts, err)) {
    if (_logger) _logger->log_error("discovery", "listener_start_failed", err.message);
    return false;
  }

  const int64_t started = _clock.now_ms();
  for (;;) {
    session.poll();
    if (session.failed(err)) return false;
    if (_clock.now_ms() - started >= (int64_t)opts.window_ms) break;
    _clock.delay_ms(opts.poll_interval_ms);
  }

  out = session.hubs();
  StaticJsonDocument<64> extra;
  extra["count"] = (uint32_t)out.size();
  JsonObjectConst o = extra.as<JsonObjectConst>();
  if (_logger) _logger->log_info("discovery", "discovery_complete", "discovery window elapsed", &o);
  return true;
}

void HhrDiscoveryEngine::prefetch_first(const std::vector<HhrHub>& hubs) {
  HhrHubPrefetcher* prefetcher = nullptr;
  {
    std::lock_guard<std::mutex> lock(_mu);
    prefetcher = _prefetcher;
  }
  if (!prefetcher || hubs.empty()) return;
  HhrError err;
  if (!prefetcher->cache_hub_data(hubs[0], err)) {
    if (_logger) _logger->log_warn("discovery", "prefetch_failed", err.message);
  }
}

bool HhrDiscoveryEngine::discover_hubs(std::vector<HhrHub>& out, HhrError& err) {
  std::unique_lock<std::mutex> lock(_mu);
  if (_in_flight) {
    const uint32_t gen = _generation;
    _waiters++;
    if (_logger) _logger->log_debug("discovery", "discovery_joined", "joining in-flight discovery");
    _cv.wait(lock, [this, gen] { return _generation != gen; });
    _waiters--;
    if (!_last_ok) {
      err = _last_error;
      return false;
    }
    out = _last_hubs;
    return true;
  }

  _in_flight = true;
  _runs++;
  const HhrDiscoveryOptions opts = _opts;
  lock.unlock();

  std::vector<HhrHub> hubs;
  HhrError run_err;
  bool ok = run_window(opts, hubs, run_err);
  if (ok) prefetch_first(hubs);

  lock.lock();
  _last_ok = ok;
  _last_hubs = hubs;
  _last_error = run_err;
  if (ok) _discovered = hubs;
  _in_flight = false;
  _generation++;
  lock.unlock();
  _cv.notify_all();

  if (!ok) {
    err = run_err;
    return false;
  }
  out = hubs;
  return true;
}

std::vector<HhrHub> HhrDiscoveryEngine::discovered() const {
  std::lock_guard<std::mutex> lock(_mu);
  return _discovered;
}

void HhrDiscoveryEngine::reset_discovered() {
  std::lock_guard<std::mutex> lock(_mu);
  _discovered.clear();
}

HhrDiscoveryStatus HhrDiscoveryEngine::status() const {
  std::lock_guard<std::mutex> lock(_mu);
  HhrDiscoveryStatus s;
  s.in_flight = _in_flight;
  s.waiters = _waiters;
  s.runs = _runs;
  s.discovered = _discovered.size();
  return s;
}
