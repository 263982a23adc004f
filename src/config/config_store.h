// src/config/config_store.h
// Role: Persistent configuration store (schema-versioned, migration-aware).
#pragma once

#include <ArduinoJson.h>
#include <stdint.h>

#include <string>

#include "../connection/hub_transport.h"
#include "../discovery/discovery_engine.h"
#include "../hub/hub_error.h"
#include "../storage/kv_store.h"

class HhrEventLogger;

// ConfigStore contract:
// - Stores one JSON document under `hhr_config` through the key/value store
// - Enforces schema_version and provides a migration hook for v1.x
// - Supports redaction for secrets in logs and API responses
// - Corrupt/invalid storage recovery resets to defaults
class HhrConfigStore {
 public:
  explicit HhrConfigStore(HhrKvStore& kv) : _kv(kv) {}

  // Loads (or creates) the stored document. Recovery to defaults still
  // returns true; false only when the store could not be read.
  bool begin(const std::string& device_suffix, HhrEventLogger* logger);

  bool ok() const { return _ok; }

  // Read-only view (internal use)
  const JsonDocument& doc() const { return _doc; }

  const std::string& device_suffix() const { return _device_suffix; }

  // Secrets are replaced with "***".
  void to_redacted_json(JsonDocument& out) const;

  // Applies a partial JSON object. Unknown keys are ignored; a value whose
  // JSON type differs from the current one fails the whole patch with
  // VALIDATION and nothing is changed. Returns true if something changed.
  bool apply_patch(const JsonObjectConst& patch, JsonArray changed_keys_out, HhrError& err);

  bool save(HhrError& err);

  // Clears config to defaults and persists.
  bool factory_reset(HhrError& err);

  // Ensures derived defaults are present (e.g., AP SSID format).
  void ensure_runtime_defaults();

  // Typed views.
  std::string device_name() const;
  std::string ntp_server() const;
  HhrConnectionTiming connection_timing() const;
  HhrDiscoveryOptions discovery_options() const;
  uint32_t cache_duration_s() const;
  bool auto_load_cache() const;
  bool debug_logging() const;

 private:
  bool load(HhrError& err);
  void set_defaults();
  bool validate_or_recover(std::string& detail);

  // v1.x migration framework.
  bool migrate_if_needed(uint32_t from_version, uint32_t to_version, std::string& detail);

  bool is_secret_key(const std::string& key) const;
  uint32_t u32(const char* key, uint32_t dflt) const;

  HhrKvStore& _kv;
  bool _ok = false;
  std::string _device_suffix;
  HhrEventLogger* _logger = nullptr;

  DynamicJsonDocument _doc{2048};
};
