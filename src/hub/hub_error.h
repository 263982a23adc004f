// src/hub/hub_error.h
// Role: Typed error record shared by every fallible hub operation.
#pragma once

#include <stdint.h>

#include <string>

enum class HhrErrorCategory : uint8_t {
  NONE = 0,
  NETWORK,          // discovery/connect/transport failures (retried, then surfaced)
  AUTHENTICATION,   // session invalid or expired (session cleared, never retried)
  VALIDATION,       // malformed hub data (surfaced immediately, never retried)
  CACHE_OPERATION,  // persisted store failures
  UNKNOWN,
};

// Operations return bool and fill an HhrError on failure.
// `code` is a short machine code (e.g. connect_timeout); `message` is user-facing.
struct HhrError {
  HhrErrorCategory category = HhrErrorCategory::NONE;
  std::string code;
  std::string message;

  bool ok() const { return category == HhrErrorCategory::NONE; }

  void clear() {
    category = HhrErrorCategory::NONE;
    code.clear();
    message.clear();
  }

  void set(HhrErrorCategory c, const char* error_code, const std::string& msg) {
    category = c;
    code = error_code ? error_code : "";
    message = msg;
  }
};

const char* hhr_error_category_to_string(HhrErrorCategory c);

// Convenience constructors.
HhrError hhr_network_error(const char* code, const std::string& msg);
HhrError hhr_auth_error(const char* code, const std::string& msg);
HhrError hhr_validation_error(const char* code, const std::string& msg);
HhrError hhr_cache_error(const char* code, const std::string& msg);
HhrError hhr_unknown_error(const char* code, const std::string& msg);
