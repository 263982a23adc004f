// src/connection/hub_transport.h
// Role: Live hub connection seam (WebSocket client on device, scripted fake in tests).
#pragma once

#include <ArduinoJson.h>
#include <stdint.h>

#include <deque>
#include <memory>
#include <string>

#include "../hub/hub_error.h"
#include "../hub/hub_types.h"

enum class HhrHoldStatus : uint8_t {
  PRESS = 0,
  RELEASE,
};

const char* hhr_hold_status_to_string(HhrHoldStatus s);

// One half of a button press. Sent with verb "render".
struct HhrHoldAction {
  std::string command;
  std::string device_id;
  HhrHoldStatus status = HhrHoldStatus::PRESS;
  int64_t timestamp_ms = 0;
};

static const char* const kHhrHoldVerb = "render";

struct HhrConnectionTiming {
  uint32_t connect_timeout_ms = 5000;
  uint32_t probe_interval_ms = 500;
  uint32_t settle_delay_ms = 1000;
  uint32_t command_hold_ms = 100;
};

// A transport instance is bound to one hub for its whole life.
class HhrHubTransport {
 public:
  virtual ~HhrHubTransport() {}

  virtual bool open(const HhrHub& hub, HhrError& err) = 0;

  // Fills `out` with an array of {id, label, isActive}. Also serves as the
  // liveness probe.
  virtual bool list_activities(JsonDocument& out, HhrError& err) = 0;

  // Fills `out` with the hub's raw device config:
  // {"device":[{id, label, type?, deviceTypeDisplayName?,
  //             controlGroup:[{name, function:[{name, label}]}]}]}
  virtual bool list_devices(JsonDocument& out, HhrError& err) = 0;

  virtual bool start_activity(const std::string& activity_id, HhrError& err) = 0;
  virtual bool send_hold_action(const HhrHoldAction& action, HhrError& err) = 0;

  // Graceful close. The instance is discarded afterwards either way.
  virtual bool end(HhrError& err) = 0;
};

class HhrTransportFactory {
 public:
  virtual ~HhrTransportFactory() {}
  virtual std::unique_ptr<HhrHubTransport> create() = 0;
};

static const size_t kHhrReplyInboxCapacity = 8;

// Frames received while a request waits for its reply. Only frames whose
// "id" matches the awaited request are kept (progress frames included), so
// unsolicited hub traffic never displaces the answer.
class HhrReplyInbox {
 public:
  // Drops queued frames and starts accepting replies to `request_id`.
  void expect(const std::string& request_id);
  // Drops queued frames and accepts nothing until the next expect().
  void reset();

  // Returns true when the frame was queued.
  bool offer(const char* data, size_t length);
  bool take(std::string& frame);

  size_t size() const { return _frames.size(); }
  size_t dropped() const { return _dropped; }

 private:
  std::string _awaited;
  std::deque<std::string> _frames;
  size_t _dropped = 0;
};
