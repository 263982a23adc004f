// src/connection/hub_transport.cpp
// Role: Live hub connection seam (WebSocket client on device, scripted fake in tests).

#include "hub_transport.h"

#include "../hub/hub_json.h"

const char* hhr_hold_status_to_string(HhrHoldStatus s) {
  switch (s) {
    case HhrHoldStatus::PRESS: return "press";
    case HhrHoldStatus::RELEASE: return "release";
  }
  return "press";
}

void HhrReplyInbox::expect(const std::string& request_id) {
  _frames.clear();
  _awaited = request_id;
}

void HhrReplyInbox::reset() {
  _frames.clear();
  _awaited.clear();
}

bool HhrReplyInbox::offer(const char* data, size_t length) {
  if (_awaited.empty() || !data || length == 0) {
    _dropped++;
    return false;
  }
  StaticJsonDocument<32> filter;
  filter["id"] = true;
  StaticJsonDocument<128> head;
  if (deserializeJson(head, data, length, DeserializationOption::Filter(filter)) ||
      hhr_json_string(head["id"]) != _awaited) {
    _dropped++;
    return false;
  }
  if (_frames.size() >= kHhrReplyInboxCapacity) {
    _frames.pop_front();
    _dropped++;
  }
  _frames.push_back(std::string(data, length));
  return true;
}

bool HhrReplyInbox::take(std::string& frame) {
  if (_frames.empty()) return false;
  frame.swap(_frames.front());
  _frames.pop_front();
  return true;
}
