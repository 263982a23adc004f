// src/session/session_store.cpp
// Role: Single hub session with absolute expiry + inactivity timeout.

#include "session_store.h"

#include <ArduinoJson.h>

bool HhrSessionStore::persist(const HhrSession& s, HhrError& err) {
  StaticJsonDocument<256> d;
  d["token"] = s.token;
  d["expiresAt"] = s.expires_at_ms;
  d["lastActivity"] = s.last_activity_at_ms;
  std::string out;
  serializeJson(d, out);
  return _kv.write(kHhrKeySession, out, err);
}

bool HhrSessionStore::create_session(const std::string& token, HhrError& err) {
  const int64_t now = _clock.now_ms();
  HhrSession s;
  s.token = token;
  s.expires_at_ms = now + kHhrSessionDurationMs;
  s.last_activity_at_ms = now;
  if (!persist(s, err)) {
    if (_logger) _logger->log_error("session", "session_create_failed", err.message);
    return false;
  }
  if (_logger) _logger->log_info("session", "session_created", "session created");
  return true;
}

void HhrSessionStore::drop(const char* reason) {
  HhrError err;
  if (!_kv.remove(kHhrKeySession, err) && _logger) {
    _logger->log_warn("session", "session_remove_failed", err.message);
  }
  if (_logger) _logger->log_info("session", "session_dropped", reason);
}

bool HhrSessionStore::get_session(HhrSession& out) {
  std::string raw;
  HhrError err;
  if (!_kv.read(kHhrKeySession, raw, err)) {
    if (_logger) _logger->log_warn("session", "session_read_failed", err.message);
    return false;
  }
  if (raw.empty()) return false;

  StaticJsonDocument<384> d;
  DeserializationError de = deserializeJson(d, raw);
  if (de || !d["token"].is<const char*>() || !d["expiresAt"].is<int64_t>() || !d["lastActivity"].is<int64_t>()) {
    drop("corrupt");
    return false;
  }

  HhrSession s;
  s.token = d["token"].as<const char*>();
  s.expires_at_ms = d["expiresAt"].as<int64_t>();
  s.last_activity_at_ms = d["lastActivity"].as<int64_t>();

  const int64_t now = _clock.now_ms();
  if (now > s.expires_at_ms) {
    drop("expired");
    return false;
  }
  if (now - s.last_activity_at_ms > kHhrSessionInactivityMs) {
    drop("inactive");
    return false;
  }
  // Clock moved backwards past the last touch.
  if (now < s.last_activity_at_ms) {
    drop("clock_skew");
    return false;
  }

  s.last_activity_at_ms = now;
  if (!persist(s, err) && _logger) {
    _logger->log_warn("session", "session_touch_failed", err.message);
  }
  out = s;
  return true;
}

void HhrSessionStore::clear_session() {
  HhrError err;
  if (!_kv.remove(kHhrKeySession, err) && _logger) {
    _logger->log_warn("session", "session_remove_failed", err.message);
  }
}

bool HhrSessionStore::validate_session() {
  HhrSession s;
  if (get_session(s)) return true;
  if (_notifier) _notifier->error("Session Expired", "Please reconnect to your Hub");
  return false;
}
