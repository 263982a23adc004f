// src/web_server.h
#pragma once
#include <Arduino.h>

class HhrConfigStore;
class HhrEventLogger;
class HhrNotifier;
class HhrConnectionManager;
class HhrDiscoveryEngine;
class HhrStateOrchestrator;
class HhrHubController;

// Everything the JSON API reads or drives. All pointers must outlive the server.
struct HhrWebDeps {
  HhrConfigStore* cfg = nullptr;
  HhrEventLogger* log = nullptr;
  HhrNotifier* notifier = nullptr;
  HhrConnectionManager* connection = nullptr;
  HhrDiscoveryEngine* discovery = nullptr;
  HhrStateOrchestrator* ui = nullptr;
  HhrHubController* controller = nullptr;
  // Pushes config values into the running components after a saved patch.
  void (*apply_config)() = nullptr;
};

void hhr_web_begin(const HhrWebDeps& deps);
void hhr_web_loop();
