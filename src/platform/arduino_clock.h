// src/platform/arduino_clock.h
// Role: HhrClock backed by the RTC (once NTP has set it) or millis().
#pragma once

#include "clock.h"

class HhrArduinoClock : public HhrClock {
 public:
  int64_t now_ms() override;
  void delay_ms(uint32_t ms) override;
};
