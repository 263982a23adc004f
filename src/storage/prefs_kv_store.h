// src/storage/prefs_kv_store.h
// Role: HhrKvStore on NVS via Arduino-ESP32 Preferences.
#pragma once

#include <mutex>

#include "kv_store.h"

// A key is split at its first '_' into NVS namespace and NVS key
// ("harmony_hub_cache" -> "harmony"/"hub_cache"). Values are stored as blobs
// so snapshots are not bound by the NVS string limit.
class HhrPrefsKvStore : public HhrKvStore {
 public:
  bool read(const std::string& key, std::string& value, HhrError& err) override;
  bool write(const std::string& key, const std::string& value, HhrError& err) override;
  bool remove(const std::string& key, HhrError& err) override;

 private:
  std::mutex _mu;
};
