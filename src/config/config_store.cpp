// src/config/config_store.cpp
// Role: Implementation of schema-versioned ConfigStore persisted through HhrKvStore.

#include "config_store.h"

#include <stdio.h>

#include "../logging/event_logger.h"
#include "version.h"

static bool json_same_type(const JsonVariantConst& a, const JsonVariantConst& b) {
  if (a.is<bool>()) return b.is<bool>();
  if (a.is<const char*>()) return b.is<const char*>();
  if (a.is<long>()) return b.is<long>();
  if (a.is<double>()) return b.is<double>();
  return false;
}

// Compared by serialized text.
static bool json_equals(const JsonVariantConst& a, const JsonVariantConst& b) {
  if (a.isNull() || b.isNull()) return a.isNull() == b.isNull();
  std::string left;
  std::string right;
  serializeJson(a, left);
  serializeJson(b, right);
  return left == right;
}

bool HhrConfigStore::begin(const std::string& device_suffix, HhrEventLogger* logger) {
  _device_suffix = device_suffix;
  _logger = logger;
  HhrError err;
  if (!load(err)) {
    // load() leaves defaults in place
    ensure_runtime_defaults();
    _ok = false;
    if (_logger) _logger->log_warn("config", "config_load_failed", err.message);
    return false;
  }
  ensure_runtime_defaults();
  _ok = true;
  return true;
}

bool HhrConfigStore::load(HhrError& err) {
  std::string cfg;
  if (!_kv.read(kHhrKeyConfig, cfg, err)) {
    set_defaults();
    return false;
  }

  if (cfg.empty()) {
    set_defaults();
    HhrError save_err;
    save(save_err);  // best-effort
    if (_logger) _logger->log_info("config", "config_defaults_created", "no_existing_config");
    return true;
  }

  _doc.clear();
  DeserializationError de = deserializeJson(_doc, cfg);
  if (de) {
    set_defaults();
    HhrError save_err;
    save(save_err);
    if (_logger) _logger->log_error("config", "config_corrupt_recovered", std::string("deserialize_failed:") + de.c_str());
    return true;
  }

  std::string detail;
  if (!validate_or_recover(detail)) {
    // validate_or_recover sets defaults on failure
    HhrError save_err;
    save(save_err);
    if (_logger) _logger->log_error("config", "config_invalid_recovered", detail);
    return true;
  }

  if (_logger) _logger->log_info("config", "cfg_load_ok", "config load ok");
  return true;
}

static void fill_defaults(JsonObject root) {
  root["schema_version"] = (uint32_t)HHR_CONFIG_SCHEMA_VERSION;

  // System
  root["device_name"] = "Harmony Remote";
  root["ntp_server"] = "pool.ntp.org";

  // Wi-Fi
  root["wifi_sta_enabled"] = false;
  root["wifi_sta_ssid"] = "";
  root["wifi_sta_password"] = "";
  root["wifi_sta_connect_timeout_s"] = 20;

  root["wifi_ap_ssid_base"] = "Harmony Remote";
  root["wifi_ap_suffix_enabled"] = true;
  root["wifi_ap_ssid"] = "";      // derived
  root["wifi_ap_password"] = "";  // derived during runtime defaults

  // Discovery
  root["discovery_port"] = kHhrDefaultDiscoveryPort;
  root["discovery_window_s"] = 60;

  // Hub connection
  root["connect_timeout_ms"] = 5000;
  root["probe_interval_ms"] = 500;
  root["settle_delay_ms"] = 1000;
  root["command_hold_ms"] = 100;

  // Cache
  root["cache_duration_s"] = 3600;
  root["auto_load_cache"] = true;

  // Logging
  root["debug_logging"] = true;
}

void HhrConfigStore::set_defaults() {
  _doc.clear();
  fill_defaults(_doc.to<JsonObject>());
}

bool HhrConfigStore::validate_or_recover(std::string& detail) {
  JsonObject root = _doc.as<JsonObject>();
  if (root.isNull()) {
    detail = "root_not_object";
    set_defaults();
    return false;
  }

  uint32_t schema = root["schema_version"] | 0;
  if (schema == 0) {
    // treat missing as v1
    schema = HHR_CONFIG_SCHEMA_VERSION;
    root["schema_version"] = schema;
  }

  if (schema != (uint32_t)HHR_CONFIG_SCHEMA_VERSION) {
    if (!migrate_if_needed(schema, (uint32_t)HHR_CONFIG_SCHEMA_VERSION, detail)) {
      detail = "schema_incompatible:" + detail;
      set_defaults();
      return false;
    }
  }

  // Append-only rule: unknown keys are tolerated, missing or mistyped known
  // keys are restored from defaults.
  DynamicJsonDocument defaults(2048);
  fill_defaults(defaults.to<JsonObject>());
  for (JsonPairConst kv : defaults.as<JsonObjectConst>()) {
    JsonVariantConst cur = root[kv.key()];
    if (cur.isNull() || !json_same_type(kv.value(), cur)) {
      root[kv.key()] = kv.value();
    }
  }
  return true;
}

bool HhrConfigStore::migrate_if_needed(uint32_t from_version, uint32_t to_version, std::string& detail) {
  if (from_version == to_version) return true;
  char buf[48];
  snprintf(buf, sizeof(buf), "no_migration_path_%lu_to_%lu", (unsigned long)from_version, (unsigned long)to_version);
  detail = buf;
  return false;
}

void HhrConfigStore::ensure_runtime_defaults() {
  JsonObject root = _doc.as<JsonObject>();

  std::string base = root["wifi_ap_ssid_base"] | "Harmony Remote";
  bool suffix_en = root["wifi_ap_suffix_enabled"] | true;
  std::string ssid = (suffix_en && !_device_suffix.empty()) ? (base + " - " + _device_suffix) : base;
  root["wifi_ap_ssid"] = ssid;

  // If AP password hasn't been set yet, use the predictable provisioning default.
  std::string ap_pass = root["wifi_ap_password"] | "";
  if (ap_pass.size() < 8) {
    root["wifi_ap_password"] = "ChangeMe-" + _device_suffix;
  }
}

bool HhrConfigStore::is_secret_key(const std::string& key) const {
  return key == "wifi_sta_password" || key == "wifi_ap_password";
}

void HhrConfigStore::to_redacted_json(JsonDocument& out) const {
  out.clear();
  JsonObject o = out.to<JsonObject>();
  for (JsonPairConst kv : _doc.as<JsonObjectConst>()) {
    std::string key = kv.key().c_str();
    if (is_secret_key(key)) {
      o[key] = "***";
    } else {
      o[key] = kv.value();
    }
  }
}

bool HhrConfigStore::apply_patch(const JsonObjectConst& patch, JsonArray changed_keys_out, HhrError& err) {
  if (patch.isNull()) {
    err = hhr_validation_error("patch_not_object", "Config patch must be a JSON object");
    return false;
  }

  JsonObject root = _doc.as<JsonObject>();

  // Type-check everything before touching the document.
  for (JsonPairConst kv : patch) {
    std::string key = kv.key().c_str();
    if (key == "schema_version" || key == "wifi_ap_ssid") continue;
    if (!root.containsKey(key)) continue;
    if (!json_same_type(root[key], kv.value())) {
      err = hhr_validation_error("patch_type_mismatch", "Config key has the wrong type: " + key);
      return false;
    }
  }

  bool changed = false;
  for (JsonPairConst kv : patch) {
    std::string key = kv.key().c_str();
    // Derived or fixed keys are never patched.
    if (key == "schema_version" || key == "wifi_ap_ssid") continue;
    if (!root.containsKey(key)) continue;

    if (!json_equals(root[key], kv.value())) {
      root[key] = kv.value();
      changed = true;
      changed_keys_out.add(key);
    }
  }

  if (changed) {
    ensure_runtime_defaults();
  }
  return changed;
}

bool HhrConfigStore::save(HhrError& err) {
  std::string out;
  size_t written = serializeJson(_doc, out);
  if (written == 0 || out.empty()) {
    err = hhr_cache_error("serialize_failed", "Failed to serialize config");
    return false;
  }
  return _kv.write(kHhrKeyConfig, out, err);
}

bool HhrConfigStore::factory_reset(HhrError& err) {
  set_defaults();
  ensure_runtime_defaults();
  return save(err);
}

uint32_t HhrConfigStore::u32(const char* key, uint32_t dflt) const {
  JsonVariantConst v = _doc[key];
  if (v.is<uint32_t>()) return v.as<uint32_t>();
  return dflt;
}

std::string HhrConfigStore::device_name() const {
  return _doc["device_name"] | "Harmony Remote";
}

std::string HhrConfigStore::ntp_server() const {
  return _doc["ntp_server"] | "pool.ntp.org";
}

HhrConnectionTiming HhrConfigStore::connection_timing() const {
  HhrConnectionTiming t;
  t.connect_timeout_ms = u32("connect_timeout_ms", t.connect_timeout_ms);
  t.probe_interval_ms = u32("probe_interval_ms", t.probe_interval_ms);
  t.settle_delay_ms = u32("settle_delay_ms", t.settle_delay_ms);
  t.command_hold_ms = u32("command_hold_ms", t.command_hold_ms);
  if (t.probe_interval_ms == 0) t.probe_interval_ms = 1;
  return t;
}

HhrDiscoveryOptions HhrConfigStore::discovery_options() const {
  HhrDiscoveryOptions o;
  uint32_t port = u32("discovery_port", o.base_port);
  if (port > 0 && port <= 65535 - o.port_fallbacks) o.base_port = (uint16_t)port;
  o.window_ms = u32("discovery_window_s", o.window_ms / 1000) * 1000;
  return o;
}

uint32_t HhrConfigStore::cache_duration_s() const {
  return u32("cache_duration_s", 3600);
}

bool HhrConfigStore::auto_load_cache() const {
  return _doc["auto_load_cache"] | true;
}

bool HhrConfigStore::debug_logging() const {
  return _doc["debug_logging"] | true;
}
