// node_board.cpp - implementation for node_board.hpp

#include "node_board.hpp"

#include <Arduino.h>            // pinMode, digitalWrite, millis, delay

// Output mode first, then a known "off" level so the LED does not float
// lit between reset and the first set().
void GpioNodeIndicator::begin() {
  pinMode(pin_, OUTPUT);
  set(false);
}

// Boards wire the LED either way; active_high_ picks the level for "on".
void GpioNodeIndicator::set(bool on) {
  digitalWrite(pin_, (on == active_high_) ? HIGH : LOW);
}

// millis() wraps after ~49.7 days; the scheduler uses unsigned deltas.
uint32_t ArduinoNodeClock::now_ms() {
  return static_cast<uint32_t>(millis());
}

void ArduinoNodeClock::sleep_ms(uint32_t ms) {
  delay(ms);
}
