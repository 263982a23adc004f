// src/storage/cache_store.h
// Role: Persists the last-known hub snapshot; clears every hub-related key.
#pragma once

#include <stdint.h>

#include "../hub/hub_error.h"
#include "../hub/hub_types.h"
#include "../logging/event_logger.h"
#include "../platform/clock.h"
#include "kv_store.h"

// Snapshot record under `harmony_hub_cache`:
// {"v":1,"hub":{..},"activities":[..],"devices":[..],"timestamp":<ms>}
class HhrCacheStore {
 public:
  HhrCacheStore(HhrKvStore& kv, HhrClock& clock, HhrEventLogger* logger)
      : _kv(kv), _clock(clock), _logger(logger) {}

  // Stamps `data.timestamp_ms` with the current time before writing.
  bool save(HhrCachedData data, HhrError& err);

  // `found` is false when there is no usable record. Records that fail to
  // parse or validate, or are older than `max_age_ms` (0 = no limit), are
  // removed. Returns false only when the store itself fails.
  bool load(int64_t max_age_ms, HhrCachedData& out, bool& found, HhrError& err);

  // Removes harmony_hub_cache, harmony_session and harmony_cache. Every key is
  // attempted; the first failure is reported.
  bool clear_all(HhrError& err);

 private:
  void discard(const char* reason);

  HhrKvStore& _kv;
  HhrClock& _clock;
  HhrEventLogger* _logger;
};
