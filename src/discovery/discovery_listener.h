// src/discovery/discovery_listener.h
// Role: Network listener seam for hub announcements (UDP ping + TCP callback on device).
#pragma once

#include <ArduinoJson.h>
#include <stdint.h>

#include "../hub/hub_error.h"

// Receives listener events on the thread that calls poll().
class HhrDiscoveryEvents {
 public:
  virtual ~HhrDiscoveryEvents() {}

  // `descriptor` is the raw announcement (uuid, ip, friendlyName, remoteId, ...).
  virtual void on_hub_online(JsonObjectConst descriptor) = 0;

  // Terminal listener failure; the run ends with this error.
  virtual void on_error(const HhrError& err) = 0;
};

class HhrDiscoveryListener {
 public:
  virtual ~HhrDiscoveryListener() {}

  // Binds `port` and starts announcing. A bound port reports code "port_in_use".
  virtual bool start(uint16_t port, HhrDiscoveryEvents* sink, HhrError& err) = 0;

  // Pumps sockets and timers; delivers events synchronously to the sink.
  virtual void poll() = 0;

  // Releases sockets and detaches the sink. Safe to call when not started.
  virtual void stop() = 0;
};
