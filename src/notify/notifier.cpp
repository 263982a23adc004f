// src/notify/notifier.cpp
// Role: User-facing notifications (success/warning/error) kept in a RAM ring.

#include "notifier.h"

const char* hhr_notify_level_to_string(HhrNotifyLevel level) {
  switch (level) {
    case HhrNotifyLevel::SUCCESS: return "success";
    case HhrNotifyLevel::WARNING: return "warning";
    case HhrNotifyLevel::ERROR: return "error";
  }
  return "error";
}

void HhrNotifier::success(const std::string& title, const std::string& message) {
  post(HhrNotifyLevel::SUCCESS, title, message);
}

void HhrNotifier::warning(const std::string& title, const std::string& message) {
  post(HhrNotifyLevel::WARNING, title, message);
}

void HhrNotifier::error(const std::string& title, const std::string& message) {
  post(HhrNotifyLevel::ERROR, title, message);
}

void HhrNotifier::post(HhrNotifyLevel level, const std::string& title, const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(_mu);
    HhrNotification& n = _ring[_head];
    n.seq = ++_seq;
    n.level = level;
    n.title = title;
    n.message = message;
    _head = (_head + 1) % kMaxNotifications;
    if (_count < kMaxNotifications) _count++;
  }

  if (!_logger) return;
  StaticJsonDocument<64> extra;
  extra["level"] = hhr_notify_level_to_string(level);
  JsonObjectConst o = extra.as<JsonObjectConst>();
  std::string line = message.empty() ? title : title + ": " + message;
  if (level == HhrNotifyLevel::ERROR) {
    _logger->log_error("notify", "notification", line, &o);
  } else if (level == HhrNotifyLevel::WARNING) {
    _logger->log_warn("notify", "notification", line, &o);
  } else {
    _logger->log_info("notify", "notification", line, &o);
  }
}

std::vector<HhrNotification> HhrNotifier::recent(size_t limit) const {
  std::lock_guard<std::mutex> lock(_mu);
  std::vector<HhrNotification> out;
  size_t n = _count;
  if (limit > 0 && limit < n) n = limit;
  size_t start = (_head + kMaxNotifications - n) % kMaxNotifications;
  for (size_t i = 0; i < n; i++) {
    out.push_back(_ring[(start + i) % kMaxNotifications]);
  }
  return out;
}

void HhrNotifier::recent_json(JsonDocument& out, size_t limit) const {
  out.clear();
  JsonArray arr = out.to<JsonArray>();
  std::vector<HhrNotification> items = recent(limit);
  for (const auto& n : items) {
    JsonObject o = arr.createNestedObject();
    o["seq"] = n.seq;
    o["level"] = hhr_notify_level_to_string(n.level);
    o["title"] = n.title;
    o["message"] = n.message;
  }
}

bool HhrNotifier::last(HhrNotification& out) const {
  std::lock_guard<std::mutex> lock(_mu);
  if (_count == 0) return false;
  out = _ring[(_head + kMaxNotifications - 1) % kMaxNotifications];
  return true;
}
