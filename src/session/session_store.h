// src/session/session_store.h
// Role: Single hub session with absolute expiry + inactivity timeout.
#pragma once

#include <stdint.h>

#include <string>

#include "../hub/hub_error.h"
#include "../hub/hub_types.h"
#include "../logging/event_logger.h"
#include "../notify/notifier.h"
#include "../platform/clock.h"
#include "../storage/kv_store.h"

static const int64_t kHhrSessionDurationMs = 24LL * 60 * 60 * 1000;
static const int64_t kHhrSessionInactivityMs = 30LL * 60 * 1000;

// Persisted as {"token","expiresAt","lastActivity"} under `harmony_session`.
// Store errors never escape: reads degrade to "no session", writes are logged.
class HhrSessionStore {
 public:
  HhrSessionStore(HhrKvStore& kv, HhrClock& clock, HhrNotifier* notifier, HhrEventLogger* logger)
      : _kv(kv), _clock(clock), _notifier(notifier), _logger(logger) {}

  // Overwrites any existing session.
  bool create_session(const std::string& token, HhrError& err);

  // False when absent, unparsable, expired or idle too long (stale records are
  // deleted). On success the inactivity timer is refreshed and persisted.
  bool get_session(HhrSession& out);

  void clear_session();

  // True iff get_session() yields a session; otherwise posts the
  // "Session Expired" notification.
  bool validate_session();

 private:
  bool persist(const HhrSession& s, HhrError& err);
  void drop(const char* reason);

  HhrKvStore& _kv;
  HhrClock& _clock;
  HhrNotifier* _notifier;
  HhrEventLogger* _logger;
};
