// src/notify/notifier.h
// Role: User-facing notifications (success/warning/error) kept in a RAM ring.
#pragma once

#include <ArduinoJson.h>

#include <mutex>
#include <string>
#include <vector>

#include "../logging/event_logger.h"

enum class HhrNotifyLevel : uint8_t {
  SUCCESS = 0,
  WARNING,
  ERROR,
};

const char* hhr_notify_level_to_string(HhrNotifyLevel level);

struct HhrNotification {
  uint32_t seq = 0;
  HhrNotifyLevel level = HhrNotifyLevel::SUCCESS;
  std::string title;
  std::string message;
};

// Every notification is mirrored to the event log (source "notify").
class HhrNotifier {
 public:
  explicit HhrNotifier(HhrEventLogger* logger) : _logger(logger) {}

  void success(const std::string& title, const std::string& message = std::string());
  void warning(const std::string& title, const std::string& message = std::string());
  void error(const std::string& title, const std::string& message = std::string());

  // Oldest first; at most `limit` (0 = all) of the newest entries.
  std::vector<HhrNotification> recent(size_t limit) const;
  void recent_json(JsonDocument& out, size_t limit) const;

  // Returns false when nothing has been posted yet.
  bool last(HhrNotification& out) const;

 private:
  void post(HhrNotifyLevel level, const std::string& title, const std::string& message);

  static constexpr size_t kMaxNotifications = 16;

  HhrEventLogger* _logger;
  mutable std::mutex _mu;
  HhrNotification _ring[kMaxNotifications];
  size_t _head = 0;
  size_t _count = 0;
  uint32_t _seq = 0;
};
