// src/discovery/hub_announcement.cpp
// Role: Parses hub callback descriptors ("key:value;key:value;...").

#include "hub_announcement.h"

namespace {

std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\r' || s[b] == '\n' || s[b] == '\t')) b++;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\r' || s[e - 1] == '\n' || s[e - 1] == '\t')) e--;
  return s.substr(b, e - b);
}

}  // namespace

bool hhr_parse_hub_announcement(const std::string& payload, JsonDocument& out, HhrError& err) {
  out.clear();
  JsonObject obj = out.to<JsonObject>();
  size_t pairs = 0;
  size_t pos = 0;
  while (pos <= payload.size()) {
    size_t end = payload.find(';', pos);
    if (end == std::string::npos) end = payload.size();
    std::string item = payload.substr(pos, end - pos);
    pos = end + 1;

    size_t colon = item.find(':');
    if (colon == std::string::npos) continue;
    std::string key = trim(item.substr(0, colon));
    if (key.empty()) continue;
    obj[key] = trim(item.substr(colon + 1));
    pairs++;
  }
  if (out.overflowed()) {
    err = hhr_validation_error("invalid_announcement", "Hub announcement too large");
    return false;
  }
  if (pairs == 0) {
    err = hhr_validation_error("invalid_announcement", "Hub announcement has no fields");
    return false;
  }
  return true;
}
