// src/discovery/hub_announcement.h
// Role: Parses hub callback descriptors ("key:value;key:value;...").
#pragma once

#include <ArduinoJson.h>

#include <string>

#include "../hub/hub_error.h"

// Fills `out` with one string member per pair (value split at the first ':').
// Empty pairs are skipped. Fails with VALIDATION/invalid_announcement when no
// pair is found.
bool hhr_parse_hub_announcement(const std::string& payload, JsonDocument& out, HhrError& err);
