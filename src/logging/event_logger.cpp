// src/logging/event_logger.cpp
// Role: In-memory JSONL event logger with an optional line sink.

#include "event_logger.h"

#include <time.h>

#include "version.h"

void HhrEventLogger::begin(HhrClock* clock) {
  std::lock_guard<std::mutex> lock(_mu);
  _clock = clock;
}

void HhrEventLogger::set_sink(LineSink sink) {
  std::lock_guard<std::mutex> lock(_mu);
  _sink = sink;
}

void HhrEventLogger::set_debug_enabled(bool enabled) {
  std::lock_guard<std::mutex> lock(_mu);
  _debug = enabled;
}

bool HhrEventLogger::debug_enabled() const {
#if HHR_FEATURE_DEBUG_LOG
  std::lock_guard<std::mutex> lock(_mu);
  return _debug;
#else
  return false;
#endif
}

std::string HhrEventLogger::iso8601_now(bool& time_valid) const {
  int64_t ms = _clock ? _clock->now_ms() : 0;
  time_valid = hhr_epoch_ms_valid(ms);
  time_t now = (time_t)(ms / 1000);
  struct tm tm_utc;
  gmtime_r(&now, &tm_utc);
  char buf[32];
  strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
  return std::string(buf);
}

void HhrEventLogger::log_internal(const char* severity, const char* source, const char* event_type,
                                  const std::string& msg, const JsonObjectConst* extra) {
  LineSink sink;
  std::string line;
  {
    std::lock_guard<std::mutex> lock(_mu);
    DynamicJsonDocument d(768);
    bool time_valid = false;
    d["ts"] = iso8601_now(time_valid);
    d["seq"] = ++_seq;
    d["event_type"] = event_type;
    d["severity"] = severity;
    d["source"] = source;
    d["msg"] = msg;
    if (!time_valid) d["time_valid"] = false;
    if (extra) {
      for (JsonPairConst kv : *extra) {
        d[kv.key()] = kv.value();
      }
    }

    serializeJson(d, line);

    _events[_head] = line;
    _head = (_head + 1) % kMaxEvents;
    if (_count < kMaxEvents) _count++;
    sink = _sink;
  }
  // Outside the lock: the sink may block on a UART.
  if (sink) sink(line);
}

void HhrEventLogger::log_debug(const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra) {
  if (!debug_enabled()) return;
  log_internal("debug", source, event_type, msg, extra);
}
void HhrEventLogger::log_info(const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra) {
  log_internal("info", source, event_type, msg, extra);
}
void HhrEventLogger::log_warn(const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra) {
  log_internal("warn", source, event_type, msg, extra);
}
void HhrEventLogger::log_error(const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra) {
  log_internal("error", source, event_type, msg, extra);
}

void HhrEventLogger::log_config_change(const char* source, const JsonArrayConst& changed_keys) {
  StaticJsonDocument<512> extra;
  JsonArray arr = extra.createNestedArray("keys");
  for (JsonVariantConst v : changed_keys) {
    arr.add(v);
  }
  JsonObjectConst o = extra.as<JsonObjectConst>();
  log_internal("info", source, "config_change", "config keys updated", &o);
}

void HhrEventLogger::recent_events(JsonDocument& out, size_t limit) const {
  std::lock_guard<std::mutex> lock(_mu);
  out.clear();
  JsonArray arr = out.to<JsonArray>();
  if (_count == 0) return;

  size_t n = _count;
  if (limit > 0 && limit < n) n = limit;

  // Oldest first among the newest n.
  size_t start = (_head + kMaxEvents - n) % kMaxEvents;
  for (size_t i = 0; i < n; i++) {
    size_t idx = (start + i) % kMaxEvents;
    DynamicJsonDocument line(768);
    DeserializationError de = deserializeJson(line, _events[idx]);
    if (!de) arr.add(line.as<JsonVariantConst>());
  }
}

size_t HhrEventLogger::event_count() const {
  std::lock_guard<std::mutex> lock(_mu);
  return _count;
}

uint32_t HhrEventLogger::last_seq() const {
  std::lock_guard<std::mutex> lock(_mu);
  return _seq;
}
