// src/hub/validator.h
// Role: Sanitizes and type-checks hub records and raw hub responses.
//
// Each entity has an ordered rule list; validation stops at the first failing
// rule and reports that rule's message as a VALIDATION error. The *_response
// variants first coerce loose wire fields (missing -> "" / false) into the
// canonical record and wrap failures with the response type.
// Pure: no logging, no persistence.
#pragma once

#include <ArduinoJson.h>

#include "hub_error.h"
#include "hub_types.h"

bool hhr_validate_hub(const HhrHub& hub, HhrError& err);
bool hhr_validate_activity(const HhrActivity& activity, HhrError& err);
bool hhr_validate_command(const HhrCommand& command, HhrError& err);
// Also validates every owned command.
bool hhr_validate_device(const HhrDevice& device, HhrError& err);

// Accepts `id` or `uuid`, `hubVersion` or `current_fw_version`.
bool hhr_validate_hub_response(JsonVariantConst raw, HhrHub& out, HhrError& err);
bool hhr_validate_activity_response(JsonVariantConst raw, HhrActivity& out, HhrError& err);
// `device_id` is used when the raw command carries no deviceId of its own.
bool hhr_validate_command_response(JsonVariantConst raw, const std::string& device_id,
                                   HhrCommand& out, HhrError& err);
bool hhr_validate_device_response(JsonVariantConst raw, HhrDevice& out, HhrError& err);

// Dotted IPv4 shape check: ^(?:[0-9]{1,3}\.){3}[0-9]{1,3}$
bool hhr_is_dotted_ipv4(const std::string& s);
