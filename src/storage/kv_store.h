// src/storage/kv_store.h
// Role: Process-local key/value persistence seam (NVS Preferences on device).
#pragma once

#include <string>

#include "../hub/hub_error.h"

// Keys used by the hub stack. All three are deleted by any "clear cache" operation.
static const char* const kHhrKeyHubCache = "harmony_hub_cache";
static const char* const kHhrKeySession = "harmony_session";
static const char* const kHhrKeyGeneralCache = "harmony_cache";

// Device configuration; never touched by clear cache.
static const char* const kHhrKeyConfig = "hhr_config";

// Single-key writes are atomic; there is no multi-key transaction.
// Failures are reported as CACHE_OPERATION errors.
class HhrKvStore {
 public:
  virtual ~HhrKvStore() {}

  // Missing keys are not an error: `value` is left empty and true is returned.
  virtual bool read(const std::string& key, std::string& value, HhrError& err) = 0;
  virtual bool write(const std::string& key, const std::string& value, HhrError& err) = 0;
  // Removing a missing key succeeds.
  virtual bool remove(const std::string& key, HhrError& err) = 0;
};
