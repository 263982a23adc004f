// src/hub/hub_error.cpp
// Role: Typed error record shared by every fallible hub operation.

#include "hub_error.h"

const char* hhr_error_category_to_string(HhrErrorCategory c) {
  switch (c) {
    case HhrErrorCategory::NONE: return "none";
    case HhrErrorCategory::NETWORK: return "network";
    case HhrErrorCategory::AUTHENTICATION: return "authentication";
    case HhrErrorCategory::VALIDATION: return "validation";
    case HhrErrorCategory::CACHE_OPERATION: return "cache_operation";
    case HhrErrorCategory::UNKNOWN: return "unknown";
  }
  return "unknown";
}

static HhrError make_error(HhrErrorCategory c, const char* code, const std::string& msg) {
  HhrError e;
  e.set(c, code, msg);
  return e;
}

HhrError hhr_network_error(const char* code, const std::string& msg) {
  return make_error(HhrErrorCategory::NETWORK, code, msg);
}

HhrError hhr_auth_error(const char* code, const std::string& msg) {
  return make_error(HhrErrorCategory::AUTHENTICATION, code, msg);
}

HhrError hhr_validation_error(const char* code, const std::string& msg) {
  return make_error(HhrErrorCategory::VALIDATION, code, msg);
}

HhrError hhr_cache_error(const char* code, const std::string& msg) {
  return make_error(HhrErrorCategory::CACHE_OPERATION, code, msg);
}

HhrError hhr_unknown_error(const char* code, const std::string& msg) {
  return make_error(HhrErrorCategory::UNKNOWN, code, msg);
}
