// src/platform/arduino_clock.cpp
// Role: HhrClock backed by the RTC (once NTP has set it) or millis().

#include "arduino_clock.h"

#include <Arduino.h>
#include <sys/time.h>

int64_t HhrArduinoClock::now_ms() {
  struct timeval tv;
  gettimeofday(&tv, nullptr);
  int64_t wall = (int64_t)tv.tv_sec * 1000 + tv.tv_usec / 1000;
  if (hhr_epoch_ms_valid(wall)) return wall;
  // Before NTP sync: monotonic since boot.
  return (int64_t)millis();
}

void HhrArduinoClock::delay_ms(uint32_t ms) {
  delay(ms);
}
