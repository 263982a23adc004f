// src/storage/prefs_kv_store.cpp
// Role: HhrKvStore on NVS via Arduino-ESP32 Preferences.

#include "prefs_kv_store.h"

#include <Preferences.h>

#include <vector>

// NVS limits namespace and key names to 15 characters.
static const size_t kNvsNameMax = 15;

static bool split_key(const std::string& key, std::string& ns, std::string& name, HhrError& err) {
  size_t sep = key.find('_');
  if (sep == std::string::npos || sep == 0 || sep + 1 >= key.size()) {
    err = hhr_cache_error("bad_key", "Invalid storage key: " + key);
    return false;
  }
  ns = key.substr(0, sep);
  name = key.substr(sep + 1);
  if (ns.size() > kNvsNameMax || name.size() > kNvsNameMax) {
    err = hhr_cache_error("bad_key", "Storage key too long: " + key);
    return false;
  }
  return true;
}

bool HhrPrefsKvStore::read(const std::string& key, std::string& value, HhrError& err) {
  std::string ns, name;
  if (!split_key(key, ns, name, err)) return false;
  std::lock_guard<std::mutex> lock(_mu);
  value.clear();

  Preferences prefs;
  // Read-only open fails when the namespace was never written.
  if (!prefs.begin(ns.c_str(), true)) return true;
  if (!prefs.isKey(name.c_str())) {
    prefs.end();
    return true;
  }
  size_t len = prefs.getBytesLength(name.c_str());
  if (len == 0) {
    prefs.end();
    return true;
  }
  std::vector<char> buf(len);
  size_t got = prefs.getBytes(name.c_str(), buf.data(), len);
  prefs.end();
  if (got != len) {
    err = hhr_cache_error("prefs_read_failed", "Failed to read " + key);
    return false;
  }
  value.assign(buf.data(), len);
  return true;
}

bool HhrPrefsKvStore::write(const std::string& key, const std::string& value, HhrError& err) {
  std::string ns, name;
  if (!split_key(key, ns, name, err)) return false;
  std::lock_guard<std::mutex> lock(_mu);

  Preferences prefs;
  if (!prefs.begin(ns.c_str(), false)) {
    err = hhr_cache_error("prefs_begin_failed", "Storage unavailable");
    return false;
  }
  size_t put = prefs.putBytes(name.c_str(), value.data(), value.size());
  prefs.end();
  if (put != value.size()) {
    err = hhr_cache_error("prefs_put_failed", "Failed to write " + key);
    return false;
  }
  return true;
}

bool HhrPrefsKvStore::remove(const std::string& key, HhrError& err) {
  std::string ns, name;
  if (!split_key(key, ns, name, err)) return false;
  std::lock_guard<std::mutex> lock(_mu);

  Preferences prefs;
  if (!prefs.begin(ns.c_str(), false)) {
    err = hhr_cache_error("prefs_begin_failed", "Storage unavailable");
    return false;
  }
  bool ok = true;
  if (prefs.isKey(name.c_str())) ok = prefs.remove(name.c_str());
  prefs.end();
  if (!ok) {
    err = hhr_cache_error("prefs_remove_failed", "Failed to remove " + key);
    return false;
  }
  return true;
}
