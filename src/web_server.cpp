// src/web_server.cpp
// Role: Embedded HTTP server exposing the hub remote as a JSON API.
// Long operations are queued on the controller and answered with 202.

#include "web_server.h"

#include <WiFi.h>
#include <WebServer.h>
#include <ArduinoJson.h>

#include <string>

#include "version.h"

#include "diagnostics.h"
#include "config/config_store.h"
#include "connection/connection_manager.h"
#include "controller/hub_controller.h"
#include "discovery/discovery_engine.h"
#include "hub/hub_json.h"
#include "logging/event_logger.h"
#include "notify/notifier.h"
#include "state_machine/state_machine.h"
#include "wifi/wifi_manager.h"

static WebServer server(80);
static HhrWebDeps g_deps;

static void send_json(int code, const JsonDocument& doc) {
  String out;
  serializeJson(doc, out);
  server.send(code, "application/json", out);
}

static int http_code_for(const HhrError& err) {
  switch (err.category) {
    case HhrErrorCategory::VALIDATION:
      return err.code == "invalid_state" ? 409 : 400;
    case HhrErrorCategory::AUTHENTICATION: return 401;
    case HhrErrorCategory::NETWORK: return 502;
    default: return 500;
  }
}

static void send_error(int code, const HhrError& err) {
  StaticJsonDocument<384> doc;
  doc["error"] = err.code;
  doc["category"] = hhr_error_category_to_string(err.category);
  doc["message"] = err.message;
  send_json(code, doc);
}

static void send_error_code(int code, const char* error_code) {
  StaticJsonDocument<96> doc;
  doc["error"] = error_code;
  send_json(code, doc);
}

static bool parse_body(JsonDocument& body) {
  DeserializationError de = deserializeJson(body, server.arg("plain"));
  if (de || !body.is<JsonObject>()) {
    send_error_code(400, "bad_json");
    return false;
  }
  return true;
}

static size_t limit_arg(size_t dflt, size_t max) {
  if (!server.hasArg("limit")) return dflt;
  long v = server.arg("limit").toInt();
  if (v <= 0) return dflt;
  return (size_t)v > max ? max : (size_t)v;
}

static void handle_status() {
  StaticJsonDocument<2048> doc;
  doc["firmware"] = HHR_FIRMWARE_NAME;
  doc["version"] = HHR_FIRMWARE_VERSION;
  doc["schema_version"] = HHR_CONFIG_SCHEMA_VERSION;
  doc["device_name"] = g_deps.cfg->device_name();
  doc["uptime_ms"] = (uint32_t)millis();
  hhr_device_info_to_json(hhr_device_info(), doc.createNestedObject("device"));

  HhrWifiStatus w = hhr_wifi_status();
  JsonObject wifi = doc.createNestedObject("wifi");
  wifi["mode"] = w.mode;
  wifi["ssid"] = w.ssid;
  wifi["ip"] = w.ip;
  wifi["rssi"] = w.rssi;
  wifi["connected"] = w.connected;

  HhrUiState ui_state;
  HhrUiContext ctx;
  g_deps.ui->snapshot(ui_state, ctx);
  JsonObject ui = doc.createNestedObject("ui");
  ui["state"] = hhr_ui_state_to_string(ui_state);
  ui["hubs"] = (uint32_t)ctx.hubs.size();
  if (ctx.has_selected_hub) {
    hhr_hub_to_json(ctx.selected_hub, ui.createNestedObject("selected_hub"));
  }
  if (!ctx.current_activity_id.empty()) ui["current_activity_id"] = ctx.current_activity_id;
  if (ctx.has_error) {
    JsonObject e = ui.createNestedObject("last_error");
    e["category"] = hhr_error_category_to_string(ctx.error.category);
    e["code"] = ctx.error.code;
    e["message"] = ctx.error.message;
  }

  JsonObject conn = doc.createNestedObject("connection");
  conn["state"] = hhr_connection_state_to_string(g_deps.connection->state());
  conn["has_handle"] = g_deps.connection->has_transport();
  conn["retry_count"] = g_deps.connection->retry_count();
  HhrHub last;
  if (g_deps.connection->last_hub(last)) conn["last_hub_id"] = last.id;

  HhrDiscoveryStatus ds = g_deps.discovery->status();
  JsonObject disc = doc.createNestedObject("discovery");
  disc["in_flight"] = ds.in_flight;
  disc["waiters"] = ds.waiters;
  disc["runs"] = ds.runs;
  disc["discovered"] = (uint32_t)ds.discovered;

  HhrControllerStatus cs = g_deps.controller->status();
  JsonObject queue = doc.createNestedObject("queue");
  queue["pending"] = (uint32_t)cs.pending;
  queue["busy"] = cs.busy;
  if (cs.has_last) {
    queue["last_request"] = hhr_request_type_to_string(cs.last_type);
    queue["last_ok"] = cs.last_ok;
    if (!cs.last_ok) queue["last_error"] = cs.last_error.code;
  }

  doc["events"] = (uint32_t)g_deps.log->event_count();
  doc["last_seq"] = g_deps.log->last_seq();
  send_json(200, doc);
}

static void handle_events() {
  size_t limit = limit_arg(20, 60);
  DynamicJsonDocument out(16384);
  g_deps.log->recent_events(out, limit);
  send_json(200, out);
}

static void handle_notifications() {
  size_t limit = limit_arg(16, 16);
  DynamicJsonDocument out(4096);
  g_deps.notifier->recent_json(out, limit);
  send_json(200, out);
}

static void handle_hubs() {
  HhrUiContext ctx = g_deps.ui->context();
  DynamicJsonDocument out(2048);
  JsonArray hubs = out.createNestedArray("hubs");
  for (const auto& h : ctx.hubs) {
    hhr_hub_to_json(h, hubs.createNestedObject());
  }
  if (ctx.has_selected_hub) out["selected"] = ctx.selected_hub.id;
  send_json(200, out);
}

static void handle_hub_select() {
  StaticJsonDocument<256> body;
  if (!parse_body(body)) return;
  std::string hub_id = body["hubId"] | "";
  HhrError err;
  if (!g_deps.controller->select_hub(hub_id, err)) {
    send_error(http_code_for(err), err);
    return;
  }
  StaticJsonDocument<64> doc;
  doc["ok"] = true;
  send_json(200, doc);
}

static void queue_request(const HhrRequest& req) {
  HhrError err;
  if (!g_deps.controller->enqueue(req, err)) {
    send_error(429, err);
    return;
  }
  StaticJsonDocument<128> doc;
  doc["queued"] = true;
  doc["request"] = hhr_request_type_to_string(req.type);
  send_json(202, doc);
}

static void handle_simple_request(HhrRequestType type) {
  HhrRequest req;
  req.type = type;
  queue_request(req);
}

static void handle_activity_start() {
  StaticJsonDocument<256> body;
  if (!parse_body(body)) return;
  HhrRequest req;
  req.type = HhrRequestType::START_ACTIVITY;
  req.activity_id = hhr_json_string(body["activityId"]);
  if (req.activity_id.empty()) {
    send_error_code(400, "missing_activity_id");
    return;
  }
  queue_request(req);
}

static void handle_command() {
  StaticJsonDocument<256> body;
  if (!parse_body(body)) return;
  HhrRequest req;
  req.type = HhrRequestType::EXECUTE_COMMAND;
  req.device_id = hhr_json_string(body["deviceId"]);
  req.command_id = hhr_json_string(body["commandId"]);
  if (req.device_id.empty() || req.command_id.empty()) {
    send_error_code(400, "missing_command");
    return;
  }
  queue_request(req);
}

static void handle_activities() {
  HhrUiContext ctx = g_deps.ui->context();
  DynamicJsonDocument out(4096);
  JsonArray arr = out.createNestedArray("activities");
  for (const auto& a : ctx.activities) {
    hhr_activity_to_json(a, arr.createNestedObject());
  }
  if (!ctx.current_activity_id.empty()) out["current"] = ctx.current_activity_id;
  send_json(200, out);
}

static void handle_devices() {
  HhrUiContext ctx = g_deps.ui->context();
  size_t commands = 0;
  for (const auto& d : ctx.devices) commands += d.commands.size();
  DynamicJsonDocument out(1024 + ctx.devices.size() * 256 + commands * 192);
  JsonArray arr = out.createNestedArray("devices");
  for (const auto& d : ctx.devices) {
    hhr_device_to_json(d, arr.createNestedObject());
  }
  if (out.overflowed()) {
    send_error_code(500, "response_too_large");
    return;
  }
  send_json(200, out);
}

static void handle_config_get() {
  DynamicJsonDocument out(2048);
  g_deps.cfg->to_redacted_json(out);
  send_json(200, out);
}

static void handle_config_post() {
  DynamicJsonDocument body(2048);
  if (!parse_body(body)) return;

  DynamicJsonDocument changed(512);
  JsonArray changed_keys = changed.to<JsonArray>();
  HhrError err;
  bool did_change = g_deps.cfg->apply_patch(body.as<JsonObjectConst>(), changed_keys, err);
  if (!err.ok()) {
    send_error(400, err);
    return;
  }

  if (did_change) {
    HhrError save_err;
    if (!g_deps.cfg->save(save_err)) {
      send_error(500, save_err);
      return;
    }
    g_deps.log->log_config_change("ui", changed.as<JsonArrayConst>());
    if (g_deps.apply_config) g_deps.apply_config();
  }

  StaticJsonDocument<512> doc;
  doc["ok"] = true;
  doc["changed"] = changed.as<JsonArrayConst>();
  send_json(200, doc);
}

void hhr_web_begin(const HhrWebDeps& deps) {
  g_deps = deps;

  server.on("/api/status", HTTP_GET, handle_status);
  server.on("/api/events", HTTP_GET, handle_events);
  server.on("/api/notifications", HTTP_GET, handle_notifications);

  server.on("/api/hubs", HTTP_GET, handle_hubs);
  server.on("/api/hubs/select", HTTP_POST, handle_hub_select);

  server.on("/api/discover", HTTP_POST, []() { handle_simple_request(HhrRequestType::DISCOVER); });
  server.on("/api/connect", HTTP_POST, []() { handle_simple_request(HhrRequestType::CONNECT); });
  server.on("/api/disconnect", HTTP_POST, []() { handle_simple_request(HhrRequestType::DISCONNECT); });
  server.on("/api/cache/load", HTTP_POST, []() { handle_simple_request(HhrRequestType::LOAD_CACHE); });
  server.on("/api/cache/clear", HTTP_POST, []() { handle_simple_request(HhrRequestType::CLEAR_CACHE); });

  server.on("/api/activities", HTTP_GET, handle_activities);
  server.on("/api/activity/start", HTTP_POST, handle_activity_start);
  server.on("/api/devices", HTTP_GET, handle_devices);
  server.on("/api/command", HTTP_POST, handle_command);

  server.on("/api/config", HTTP_GET, handle_config_get);
  server.on("/api/config", HTTP_POST, handle_config_post);

  server.onNotFound([]() { send_error_code(404, "not_found"); });

  server.begin();
  g_deps.log->log_info("web", "web_started", "http api listening on :80");
}

void hhr_web_loop() {
  server.handleClient();
}
