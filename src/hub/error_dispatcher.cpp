// src/hub/error_dispatcher.cpp
// Role: Maps an error category to its recovery action + user notification.

#include "error_dispatcher.h"

#include <stdio.h>

void HhrErrorDispatcher::handle(const HhrError& err, const char* source) {
  if (err.ok()) return;

  if (_logger) {
    StaticJsonDocument<192> extra;
    extra["category"] = hhr_error_category_to_string(err.category);
    extra["code"] = err.code;
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _logger->log_error(source, "error_handled", err.message, &o);
  }

  switch (err.category) {
    case HhrErrorCategory::NETWORK: {
      _network_failures++;
      char suffix[24];
      snprintf(suffix, sizeof(suffix), " (%lu/%lu)", (unsigned long)_network_failures,
               (unsigned long)kHhrNetworkFailureBudget);
      _notifier.warning("Network Error", err.message + suffix);
      break;
    }
    case HhrErrorCategory::AUTHENTICATION:
      _sessions.clear_session();
      _notifier.error("Authentication Error", "Please reconnect to your Hub");
      break;
    case HhrErrorCategory::VALIDATION:
      _notifier.error("Validation Error", err.message);
      break;
    case HhrErrorCategory::CACHE_OPERATION:
      _notifier.error("Storage Error", err.message);
      break;
    case HhrErrorCategory::UNKNOWN:
    case HhrErrorCategory::NONE:
      _notifier.error("Error", err.message);
      break;
  }
}

void HhrErrorDispatcher::note_success() {
  _network_failures = 0;
}
