// src/discovery/udp_discovery_listener.h
// Role: Harmony reverse-discovery listener: UDP broadcast ping + TCP callback server.
#pragma once

#include <Arduino.h>
#include <WiFi.h>
#include <WiFiUdp.h>

#include <memory>
#include <string>

#include "discovery_listener.h"

// Hubs answer the broadcast by opening a TCP connection to `port` and writing
// a "key:value;..." descriptor, then closing.
class HhrUdpDiscoveryListener : public HhrDiscoveryListener {
 public:
  bool start(uint16_t port, HhrDiscoveryEvents* sink, HhrError& err) override;
  void poll() override;
  void stop() override;

 private:
  struct Pending {
    WiFiClient client;
    std::string buffer;
    uint32_t opened_ms = 0;
  };

  void send_ping();
  void accept_clients();
  void drain_clients();
  void finish(Pending& p);

  static constexpr size_t kMaxClients = 4;
  static constexpr uint16_t kPingPort = 5224;
  static constexpr uint32_t kPingIntervalMs = 5000;
  static constexpr uint32_t kClientTimeoutMs = 3000;
  static constexpr size_t kMaxDescriptorBytes = 1024;

  std::unique_ptr<WiFiServer> _server;
  WiFiUDP _udp;
  HhrDiscoveryEvents* _sink = nullptr;
  uint16_t _port = 0;
  uint32_t _last_ping_ms = 0;
  Pending _clients[kMaxClients];
};
