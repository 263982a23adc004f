// src/discovery/udp_discovery_listener.cpp
// Role: Harmony reverse-discovery listener: UDP broadcast ping + TCP callback server.

#include "udp_discovery_listener.h"

#include <ArduinoJson.h>
#include <stdio.h>
#include <string.h>

#include "hub_announcement.h"

static const char* kPingPrefix = "_logitech-reverse-bonjour._tcp.local.\n";

bool HhrUdpDiscoveryListener::start(uint16_t port, HhrDiscoveryEvents* sink, HhrError& err) {
  stop();
  if (WiFi.status() != WL_CONNECTED) {
    err = hhr_network_error("wifi_not_connected", "Wi-Fi is not connected");
    return false;
  }

  std::unique_ptr<WiFiServer> server(new WiFiServer(port));
  server->begin();
  if (!*server) {
    err = hhr_network_error("port_in_use", "Discovery port in use");
    return false;
  }
  if (!_udp.begin(0)) {
    server->end();
    err = hhr_network_error("udp_begin_failed", "Could not open discovery socket");
    return false;
  }

  _server.swap(server);
  _sink = sink;
  _port = port;
  send_ping();
  return true;
}

void HhrUdpDiscoveryListener::send_ping() {
  char msg[80];
  snprintf(msg, sizeof(msg), "%s%u", kPingPrefix, (unsigned)_port);
  _udp.beginPacket(IPAddress(255, 255, 255, 255), kPingPort);
  _udp.write((const uint8_t*)msg, strlen(msg));
  _udp.endPacket();
  _last_ping_ms = millis();
}

void HhrUdpDiscoveryListener::accept_clients() {
  for (;;) {
    WiFiClient c = _server->available();
    if (!c) return;
    bool placed = false;
    for (size_t i = 0; i < kMaxClients; i++) {
      if (_clients[i].client) continue;
      _clients[i].client = c;
      _clients[i].buffer.clear();
      _clients[i].opened_ms = millis();
      placed = true;
      break;
    }
    if (!placed) c.stop();
  }
}

void HhrUdpDiscoveryListener::finish(Pending& p) {
  IPAddress peer = p.client.remoteIP();
  p.client.stop();
  p.client = WiFiClient();
  if (p.buffer.empty() || !_sink) {
    p.buffer.clear();
    return;
  }
  DynamicJsonDocument doc(1536);
  HhrError err;
  if (hhr_parse_hub_announcement(p.buffer, doc, err)) {
    // The descriptor's ip is authoritative; fall back to the peer address.
    if (!doc.containsKey("ip")) doc["ip"] = peer.toString();
    _sink->on_hub_online(doc.as<JsonObjectConst>());
  }
  p.buffer.clear();
}

void HhrUdpDiscoveryListener::drain_clients() {
  const uint32_t now = millis();
  for (size_t i = 0; i < kMaxClients; i++) {
    Pending& p = _clients[i];
    if (!p.client) continue;
    while (p.client.available() > 0 && p.buffer.size() < kMaxDescriptorBytes) {
      p.buffer.push_back((char)p.client.read());
    }
    if (!p.client.connected() || p.buffer.size() >= kMaxDescriptorBytes || now - p.opened_ms > kClientTimeoutMs) {
      finish(p);
    }
  }
}

void HhrUdpDiscoveryListener::poll() {
  if (!_server) return;
  if (WiFi.status() != WL_CONNECTED) {
    if (_sink) _sink->on_error(hhr_network_error("wifi_lost", "Wi-Fi connection lost during discovery"));
    return;
  }
  if (millis() - _last_ping_ms >= kPingIntervalMs) send_ping();
  accept_clients();
  drain_clients();
}

void HhrUdpDiscoveryListener::stop() {
  for (size_t i = 0; i < kMaxClients; i++) {
    if (_clients[i].client) _clients[i].client.stop();
    _clients[i].client = WiFiClient();
    _clients[i].buffer.clear();
  }
  if (_server) {
    _server->end();
    _server.reset();
  }
  _udp.stop();
  _sink = nullptr;
  _port = 0;
}
