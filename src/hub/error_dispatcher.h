// src/hub/error_dispatcher.h
// Role: Maps an error category to its recovery action + user notification.
#pragma once

#include <stdint.h>

#include "hub_error.h"
#include "../logging/event_logger.h"
#include "../notify/notifier.h"
#include "../session/session_store.h"

// Network failures are counted against this budget in the warning text.
static const uint32_t kHhrNetworkFailureBudget = 3;

class HhrErrorDispatcher {
 public:
  HhrErrorDispatcher(HhrSessionStore& sessions, HhrNotifier& notifier, HhrEventLogger* logger)
      : _sessions(sessions), _notifier(notifier), _logger(logger) {}

  // `source` names the failed operation in the log line.
  void handle(const HhrError& err, const char* source = "hub");

  // Resets the network failure counter.
  void note_success();

  uint32_t network_failures() const { return _network_failures; }

 private:
  HhrSessionStore& _sessions;
  HhrNotifier& _notifier;
  HhrEventLogger* _logger;
  uint32_t _network_failures = 0;
};
