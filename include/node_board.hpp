#pragma once
/**
 * @file node_board.hpp
 * @brief TTGO LoRa32 V2.1 pin map, plus the LED indicator and Arduino clock.
 *
 * Pin numbers are for LilyGO TTGO LoRa32 V2.1 (1.6.x). Other boards only
 * need this file changed.
 */

#include "node_hal.hpp"
#include "node_radio.hpp"

#include <cstdint>

// I2C (SSD1306)
static constexpr int BOARD_I2C_SDA_PIN = 21;
static constexpr int BOARD_I2C_SCL_PIN = 22;
static constexpr uint8_t BOARD_OLED_ADDR = 0x3C;

// On-board green LED
static constexpr int BOARD_LED_PIN = 25;

/** SX127x wiring. */
static constexpr NodeRadioPins BOARD_RADIO_PINS = {
  /*sck=*/5, /*miso=*/19, /*mosi=*/27, /*ss=*/18, /*rst=*/23, /*dio0=*/26
};

/** NodeIndicator on one GPIO. */
class GpioNodeIndicator : public NodeIndicator {
public:
  explicit GpioNodeIndicator(int pin, bool active_high = true)
      : pin_(pin), active_high_(active_high) {}

  /** Configure the pin as output and switch the light off. */
  void begin();

  void set(bool on) override;

private:
  int  pin_;
  bool active_high_;
};

/** NodeClock on millis()/delay(). */
class ArduinoNodeClock : public NodeClock {
public:
  uint32_t now_ms() override;
  void sleep_ms(uint32_t ms) override;
};
