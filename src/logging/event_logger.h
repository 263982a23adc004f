// src/logging/event_logger.h
// Role: In-memory JSONL event logger with an optional line sink.
#pragma once

#include <ArduinoJson.h>

#include <functional>
#include <mutex>
#include <string>

#include "../platform/clock.h"

// Each event is one JSON object serialized to a single line:
// {ts, seq, event_type, severity, source, msg, time_valid?, ...extra}
// - Monotonic sequence number (RAM only; restarts at 1 on boot)
// - RAM ring buffer of recent events for `/api/events`
// - Callers never pass secrets as values

class HhrEventLogger {
 public:
  typedef std::function<void(const std::string&)> LineSink;

  // `clock` may be null; timestamps are then reported as invalid.
  void begin(HhrClock* clock);

  // Receives each serialized line (Serial on device, capture in tests).
  void set_sink(LineSink sink);

  // Runtime switch; compiled out entirely when HHR_FEATURE_DEBUG_LOG is 0.
  void set_debug_enabled(bool enabled);
  bool debug_enabled() const;

  void log_debug(const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra = nullptr);
  void log_info (const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra = nullptr);
  void log_warn (const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra = nullptr);
  void log_error(const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra = nullptr);

  // Adds a config change event. Only key names are allowed.
  void log_config_change(const char* source, const JsonArrayConst& changed_keys);

  // Copies the last N events into `out` as a JSON array of objects (oldest first).
  void recent_events(JsonDocument& out, size_t limit) const;

  size_t event_count() const;
  uint32_t last_seq() const;

 private:
  void log_internal(const char* severity, const char* source, const char* event_type, const std::string& msg,
                    const JsonObjectConst* extra);

  std::string iso8601_now(bool& time_valid) const;

  static constexpr size_t kMaxEvents = 60;

  mutable std::mutex _mu;
  HhrClock* _clock = nullptr;
  LineSink _sink;
  bool _debug = true;
  uint32_t _seq = 0;
  std::string _events[kMaxEvents];
  size_t _head = 0;
  size_t _count = 0;
};
