// src/platform/clock.h
// Role: Time source + blocking delay seam (Arduino clock on device, fake clock in tests).
#pragma once

#include <stdint.h>

class HhrClock {
 public:
  virtual ~HhrClock() {}

  // Milliseconds since the Unix epoch when wall time is valid; otherwise
  // milliseconds since boot.
  virtual int64_t now_ms() = 0;

  // Suspends the calling task. Used for settling delays, probe polling,
  // command hold and retry backoff.
  virtual void delay_ms(uint32_t ms) = 0;
};

// Wall time is considered valid once it is past late 2023.
inline bool hhr_epoch_ms_valid(int64_t ms) {
  return ms > 1700000000LL * 1000LL;
}
