// src/connection/ws_hub_transport.cpp
// Role: HhrHubTransport over the hub's local WebSocket API (port 8088).

#include "ws_hub_transport.h"

#include <HTTPClient.h>
#include <stdio.h>

#include "../hub/hub_json.h"

static const char* kCmdConfig = "vnd.logitech.harmony/vnd.logitech.harmony.engine?config";
static const char* kCmdCurrentActivity = "vnd.logitech.harmony/vnd.logitech.harmony.engine?getCurrentActivity";
static const char* kCmdRunActivity = "harmony.activityengine?runactivity";
static const char* kCmdHoldAction = "vnd.logitech.harmony/vnd.logitech.harmony.engine?holdAction";
static const char* kProvisionOrigin = "http://sl.dhg.myharmony.com";

HhrWsHubTransport::~HhrWsHubTransport() {
  if (_open) _ws.disconnect();
}

void HhrWsHubTransport::on_event(WStype_t type, uint8_t* payload, size_t length) {
  switch (type) {
    case WStype_DISCONNECTED:
      _connected = false;
      break;
    case WStype_CONNECTED:
      _connected = true;
      break;
    case WStype_TEXT:
      _inbox.offer((const char*)payload, length);
      break;
    default:
      break;
  }
}

bool HhrWsHubTransport::provision(const std::string& ip, std::string& remote_id, HhrError& err) {
  StaticJsonDocument<160> body;
  body["id"] = 1;
  body["cmd"] = "setup.account?getProvisionInfo";
  body["timeout"] = 90000;
  String payload;
  serializeJson(body, payload);

  HTTPClient http;
  String url = String("http://") + ip.c_str() + ":" + String(kHubPort) + "/";
  http.begin(url);
  http.setTimeout(kRequestTimeoutMs);
  http.addHeader("Content-Type", "application/json");
  http.addHeader("Accept-Charset", "utf-8");
  http.addHeader("Origin", kProvisionOrigin);
  int code = http.POST(payload);
  if (code < 200 || code >= 300) {
    http.end();
    char msg[64];
    snprintf(msg, sizeof(msg), "Hub provisioning failed (HTTP %d)", code);
    err = hhr_network_error("provision_failed", msg);
    return false;
  }
  String resp = http.getString();
  http.end();

  StaticJsonDocument<64> filter;
  filter["data"]["activeRemoteId"] = true;
  StaticJsonDocument<256> d;
  DeserializationError de = deserializeJson(d, resp, DeserializationOption::Filter(filter));
  remote_id = de ? std::string() : hhr_json_string(d["data"]["activeRemoteId"]);
  if (remote_id.empty()) {
    err = hhr_network_error("provision_failed", "Hub did not report a remote id");
    return false;
  }
  return true;
}

bool HhrWsHubTransport::open(const HhrHub& hub, HhrError& err) {
  _remote_id = hub.remote_id;
  if (_remote_id.empty() && !provision(hub.ip, _remote_id, err)) return false;

  String path = String("/?domain=svcs.myharmony.com&hubId=") + _remote_id.c_str();
  _ws.onEvent([this](WStype_t type, uint8_t* payload, size_t length) { on_event(type, payload, length); });
  _ws.begin(hub.ip.c_str(), kHubPort, path.c_str());
  _ws.setReconnectInterval(kRequestTimeoutMs);
  _open = true;

  const uint32_t started = millis();
  while (!_connected && millis() - started < kRequestTimeoutMs) {
    _ws.loop();
    delay(10);
  }
  if (!_connected) {
    _ws.disconnect();
    _open = false;
    err = hhr_network_error("ws_connect_failed", "Could not open hub WebSocket");
    return false;
  }
  return true;
}

bool HhrWsHubTransport::send_hbus(const char* cmd, JsonObjectConst params, uint32_t& id_out, HhrError& err) {
  if (!_open || !_connected) {
    err = hhr_network_error("not_connected", "Hub WebSocket is not connected");
    return false;
  }
  char id[12];
  id_out = _next_id++;
  snprintf(id, sizeof(id), "%lu", (unsigned long)id_out);

  DynamicJsonDocument msg(1024);
  msg["hubId"] = _remote_id;
  msg["timeout"] = 30000;
  JsonObject hbus = msg.createNestedObject("hbus");
  hbus["cmd"] = cmd;
  hbus["id"] = id;
  hbus["params"] = params;
  String out;
  serializeJson(msg, out);
  if (!_ws.sendTXT(out)) {
    err = hhr_network_error("send_failed", "Failed to send to hub");
    return false;
  }
  return true;
}

// Frames reaching the inbox already carry the awaited id.
bool HhrWsHubTransport::await_response(const JsonDocument& filter, JsonDocument& out, HhrError& err) {
  StaticJsonDocument<64> head_filter;
  head_filter["code"] = true;
  head_filter["msg"] = true;

  const uint32_t started = millis();
  while (millis() - started < kRequestTimeoutMs) {
    _ws.loop();
    std::string frame;
    while (_inbox.take(frame)) {
      StaticJsonDocument<256> head;
      if (deserializeJson(head, frame, DeserializationOption::Filter(head_filter))) continue;

      std::string code = hhr_json_string(head["code"]);
      // 100 = progress; the final answer follows with the same id.
      if (code == "100") continue;
      if (!code.empty() && code != "200") {
        err = hhr_network_error("hub_error", "Hub rejected request: " + hhr_json_string(head["msg"]));
        return false;
      }
      DeserializationError de = deserializeJson(out, frame, DeserializationOption::Filter(filter));
      if (de) {
        err = hhr_validation_error("bad_response", std::string("Unreadable hub response: ") + de.c_str());
        return false;
      }
      return true;
    }
    if (!_connected) {
      err = hhr_network_error("lost_connection", "Hub WebSocket closed");
      return false;
    }
    delay(5);
  }
  err = hhr_network_error("request_timeout", "Hub did not answer in time");
  return false;
}

bool HhrWsHubTransport::request(const char* cmd, JsonObjectConst params, const JsonDocument& filter,
                                JsonDocument& out, HhrError& err) {
  uint32_t id = 0;
  if (!send_hbus(cmd, params, id, err)) return false;
  char want[12];
  snprintf(want, sizeof(want), "%lu", (unsigned long)id);
  _inbox.expect(want);
  const bool ok = await_response(filter, out, err);
  _inbox.reset();
  return ok;
}

bool HhrWsHubTransport::list_activities(JsonDocument& out, HhrError& err) {
  StaticJsonDocument<64> params;
  params["verb"] = "get";
  StaticJsonDocument<128> filter;
  filter["data"]["activity"][0]["id"] = true;
  filter["data"]["activity"][0]["label"] = true;
  DynamicJsonDocument cfg(out.capacity());
  if (!request(kCmdConfig, params.as<JsonObjectConst>(), filter, cfg, err)) return false;

  StaticJsonDocument<64> cur_params;
  cur_params["verb"] = "get";
  cur_params["format"] = "json";
  StaticJsonDocument<64> cur_filter;
  cur_filter["data"]["result"] = true;
  StaticJsonDocument<256> cur;
  if (!request(kCmdCurrentActivity, cur_params.as<JsonObjectConst>(), cur_filter, cur, err)) return false;
  const std::string current = hhr_json_string(cur["data"]["result"]);

  out.clear();
  JsonArray arr = out.to<JsonArray>();
  for (JsonVariantConst a : cfg["data"]["activity"].as<JsonArrayConst>()) {
    JsonObject o = arr.createNestedObject();
    o["id"] = a["id"];
    o["label"] = a["label"];
    o["isActive"] = !current.empty() && hhr_json_string(a["id"]) == current;
  }
  return true;
}

bool HhrWsHubTransport::list_devices(JsonDocument& out, HhrError& err) {
  StaticJsonDocument<64> params;
  params["verb"] = "get";
  StaticJsonDocument<384> filter;
  JsonObject dev = filter["data"]["device"].createNestedObject();
  dev["id"] = true;
  dev["label"] = true;
  dev["type"] = true;
  dev["deviceTypeDisplayName"] = true;
  JsonObject group = dev["controlGroup"].createNestedObject();
  group["name"] = true;
  JsonObject fn = group["function"].createNestedObject();
  fn["name"] = true;
  fn["label"] = true;

  DynamicJsonDocument cfg(out.capacity());
  if (!request(kCmdConfig, params.as<JsonObjectConst>(), filter, cfg, err)) return false;

  out.clear();
  out["device"] = cfg["data"]["device"];
  if (out.overflowed()) {
    err = hhr_validation_error("config_too_large", "Hub configuration is too large");
    return false;
  }
  return true;
}

bool HhrWsHubTransport::start_activity(const std::string& activity_id, HhrError& err) {
  StaticJsonDocument<256> params;
  params["async"] = "true";
  params["timestamp"] = 0;
  params.createNestedObject("args")["rule"] = "start";
  params["activityId"] = activity_id;
  StaticJsonDocument<32> filter;
  filter["code"] = true;
  StaticJsonDocument<64> resp;
  return request(kCmdRunActivity, params.as<JsonObjectConst>(), filter, resp, err);
}

bool HhrWsHubTransport::send_hold_action(const HhrHoldAction& action, HhrError& err) {
  StaticJsonDocument<192> inner;
  inner["command"] = action.command;
  inner["type"] = "IRCommand";
  inner["deviceId"] = action.device_id;
  std::string inner_json;
  serializeJson(inner, inner_json);

  DynamicJsonDocument params(512);
  params["status"] = hhr_hold_status_to_string(action.status);
  params["timestamp"] = action.timestamp_ms;
  params["verb"] = kHhrHoldVerb;
  params["action"] = inner_json;

  // Fire-and-forget: the hub does not answer hold actions.
  uint32_t id = 0;
  if (!send_hbus(kCmdHoldAction, params.as<JsonObjectConst>(), id, err)) return false;
  _ws.loop();
  return true;
}

bool HhrWsHubTransport::end(HhrError& err) {
  (void)err;
  if (_open) _ws.disconnect();
  _open = false;
  _connected = false;
  _inbox.reset();
  return true;
}
