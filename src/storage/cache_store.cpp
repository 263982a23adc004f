// src/storage/cache_store.cpp
// Role: Persists the last-known hub snapshot; clears every hub-related key.

#include "cache_store.h"

#include <ArduinoJson.h>

#include "version.h"
#include "../hub/hub_json.h"
#include "../hub/validator.h"

namespace {

// Snapshots carry every command label, so size the document from the input.
size_t doc_capacity_for(size_t json_len) {
  return json_len * 2 + 1024;
}

}  // namespace

bool HhrCacheStore::save(HhrCachedData data, HhrError& err) {
  data.timestamp_ms = _clock.now_ms();

  size_t cmd_count = 0;
  for (const auto& d : data.devices) cmd_count += d.commands.size();
  DynamicJsonDocument d(4096 + data.activities.size() * 192 + data.devices.size() * 256 + cmd_count * 192);
  JsonObject root = d.to<JsonObject>();
  root["v"] = HHR_CACHE_RECORD_VERSION;
  hhr_cached_data_to_json(data, root);
  if (d.overflowed()) {
    err = hhr_cache_error("cache_too_large", "Hub data is too large to cache");
    if (_logger) _logger->log_error("cache", "cache_save_failed", err.message);
    return false;
  }

  std::string out;
  serializeJson(d, out);
  if (!_kv.write(kHhrKeyHubCache, out, err)) {
    if (_logger) _logger->log_error("cache", "cache_save_failed", err.message);
    return false;
  }

  StaticJsonDocument<128> extra;
  extra["activities"] = (uint32_t)data.activities.size();
  extra["devices"] = (uint32_t)data.devices.size();
  JsonObjectConst o = extra.as<JsonObjectConst>();
  if (_logger) _logger->log_info("cache", "cache_saved", "hub data cached for " + data.hub.friendly_name, &o);
  return true;
}

void HhrCacheStore::discard(const char* reason) {
  HhrError err;
  if (!_kv.remove(kHhrKeyHubCache, err) && _logger) {
    _logger->log_warn("cache", "cache_remove_failed", err.message);
  }
  if (_logger) _logger->log_info("cache", "cache_discarded", reason);
}

bool HhrCacheStore::load(int64_t max_age_ms, HhrCachedData& out, bool& found, HhrError& err) {
  found = false;
  std::string raw;
  if (!_kv.read(kHhrKeyHubCache, raw, err)) {
    if (_logger) _logger->log_error("cache", "cache_read_failed", err.message);
    return false;
  }
  if (raw.empty()) {
    if (_logger) _logger->log_debug("cache", "cache_empty", "no cached hub data");
    return true;
  }

  DynamicJsonDocument d(doc_capacity_for(raw.size()));
  DeserializationError de = deserializeJson(d, raw);
  if (de) {
    discard("unparsable");
    return true;
  }
  if ((d["v"] | 0) != HHR_CACHE_RECORD_VERSION || !d["timestamp"].is<int64_t>()) {
    discard("incompatible");
    return true;
  }

  HhrCachedData data;
  data.timestamp_ms = d["timestamp"].as<int64_t>();
  const int64_t now = _clock.now_ms();
  if (max_age_ms > 0 && (now < data.timestamp_ms || now - data.timestamp_ms > max_age_ms)) {
    discard("stale");
    return true;
  }

  HhrError verr;
  if (!hhr_validate_hub_response(d["hub"], data.hub, verr)) {
    if (_logger) _logger->log_warn("cache", "cache_invalid", verr.message);
    discard("invalid_hub");
    return true;
  }
  for (JsonVariantConst v : d["activities"].as<JsonArrayConst>()) {
    HhrActivity a;
    if (!hhr_validate_activity_response(v, a, verr)) {
      if (_logger) _logger->log_warn("cache", "cache_invalid", verr.message);
      discard("invalid_activity");
      return true;
    }
    data.activities.push_back(a);
  }
  for (JsonVariantConst v : d["devices"].as<JsonArrayConst>()) {
    HhrDevice dev;
    if (!hhr_validate_device_response(v, dev, verr)) {
      if (_logger) _logger->log_warn("cache", "cache_invalid", verr.message);
      discard("invalid_device");
      return true;
    }
    data.devices.push_back(dev);
  }

  out = data;
  found = true;
  if (_logger) _logger->log_info("cache", "cache_loaded", "loaded cached hub data for " + data.hub.friendly_name);
  return true;
}

bool HhrCacheStore::clear_all(HhrError& err) {
  static const char* const kKeys[] = {kHhrKeyHubCache, kHhrKeySession, kHhrKeyGeneralCache};
  bool ok = true;
  for (size_t i = 0; i < sizeof(kKeys) / sizeof(kKeys[0]); i++) {
    HhrError e;
    if (!_kv.remove(kKeys[i], e)) {
      if (_logger) _logger->log_error("cache", "cache_clear_failed", std::string(kKeys[i]) + ": " + e.message);
      if (ok) err = e;
      ok = false;
    }
  }
  if (ok && _logger) _logger->log_info("cache", "cache_cleared", "hub cache, session and general cache removed");
  return ok;
}
