// src/connection/ws_hub_transport.h
// Role: HhrHubTransport over the hub's local WebSocket API (port 8088).
#pragma once

#include <Arduino.h>
#include <ArduinoJson.h>
#include <WebSocketsClient.h>

#include <memory>
#include <string>

#include "hub_transport.h"

// Request/response over one WebSocket. Requests carry a numeric id and are
// answered by a frame echoing it; the socket is pumped from the calling task
// until that frame arrives or the request times out.
class HhrWsHubTransport : public HhrHubTransport {
 public:
  static constexpr uint16_t kHubPort = 8088;
  static constexpr uint32_t kRequestTimeoutMs = 5000;

  HhrWsHubTransport() {}
  ~HhrWsHubTransport() override;

  bool open(const HhrHub& hub, HhrError& err) override;
  bool list_activities(JsonDocument& out, HhrError& err) override;
  bool list_devices(JsonDocument& out, HhrError& err) override;
  bool start_activity(const std::string& activity_id, HhrError& err) override;
  bool send_hold_action(const HhrHoldAction& action, HhrError& err) override;
  bool end(HhrError& err) override;

 private:
  bool provision(const std::string& ip, std::string& remote_id, HhrError& err);
  bool send_hbus(const char* cmd, JsonObjectConst params, uint32_t& id_out, HhrError& err);
  bool await_response(const JsonDocument& filter, JsonDocument& out, HhrError& err);
  bool request(const char* cmd, JsonObjectConst params, const JsonDocument& filter, JsonDocument& out,
               HhrError& err);
  void on_event(WStype_t type, uint8_t* payload, size_t length);

  WebSocketsClient _ws;
  bool _open = false;
  bool _connected = false;
  std::string _remote_id;
  uint32_t _next_id = 1;
  HhrReplyInbox _inbox;
};

class HhrWsTransportFactory : public HhrTransportFactory {
 public:
  std::unique_ptr<HhrHubTransport> create() override {
    return std::unique_ptr<HhrHubTransport>(new HhrWsHubTransport());
  }
};
