// src/hub/hub_json.h
// Role: ArduinoJson encoders for hub records + loose wire-field coercion helpers.
#pragma once

#include <ArduinoJson.h>

#include <string>

#include "hub_types.h"

void hhr_hub_to_json(const HhrHub& hub, JsonObject out);
void hhr_activity_to_json(const HhrActivity& activity, JsonObject out);
void hhr_command_to_json(const HhrCommand& command, JsonObject out);
void hhr_device_to_json(const HhrDevice& device, JsonObject out);
void hhr_cached_data_to_json(const HhrCachedData& data, JsonObject out);

// Loose wire coercion: missing -> "", numbers are stringified, false -> "".
std::string hhr_json_string(JsonVariantConst v);

// Loose wire coercion: missing -> false; strings/numbers follow truthiness.
bool hhr_json_bool(JsonVariantConst v);

// Returns the first non-empty coerced string among `keys` (nullptr-terminated).
std::string hhr_json_first_string(JsonObjectConst obj, const char* const* keys);
