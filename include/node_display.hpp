#pragma once
/**
 * @page pn-node-display PingNode Display (TTGO LoRa32 + SSD1306)
 * @file node_display.hpp
 * @brief NodeDisplay on a 0.96" 128x64 SSD1306 panel, plus boot/ID screens.
 *
 * Overview
 * --------
 * A tiny display shim so the rest of the node never talks to third-party
 * graphics code. The scheduler hands it NodeFrame values (background plus
 * positioned text lines); this class turns them into Adafruit_GFX calls.
 * Two extra helpers cover bring-up: a boot banner and an identity screen.
 *
 * Where This Fits
 * ---------------
 * - The scheduler (node_scheduler.*) calls show() and refresh() through the
 *   NodeDisplay interface.
 * - main.cpp calls begin(), draw_boot() and draw_id() during setup().
 *
 * Philosophy
 * ----------
 * - The display is optional. If the panel is missing, begin() returns false
 *   and every other call is a safe no-op. The radio keeps running headless.
 * - Small font only, no wrapping. A line longer than the panel is clipped at
 *   the right edge so it never pushes the RSSI line down.
 * - I2C pins are parameters, not assumptions.
 *
 * Dependencies
 * ------------
 * - Arduino core for ESP32 (Wire/TwoWire).
 * - Adafruit_GFX and Adafruit_SSD1306.
 * - 128x64 SSD1306 on I2C, address 0x3C with a fallback probe at 0x3D.
 *
 * Electrical Notes (TTGO LoRa32 V2.x defaults)
 * --------------------------------------------
 * - SDA: GPIO 21
 * - SCL: GPIO 22
 *
 * Typical Usage
 * -------------
 * @code
 * Ssd1306NodeDisplay oled;
 * if (oled.begin(21, 22, 0x3C)) {
 *     oled.draw_boot("PingNode Booting...");
 *     oled.draw_id(cfg.node_addr, cfg.dest_addr);
 * }
 * @endcode
 *
 * Do not leak Adafruit types through this header.
 *
 * @author Leo
 */

#include "node_hal.hpp"

#include <stdint.h>

class Ssd1306NodeDisplay : public NodeDisplay {
public:
  /**
   * @brief Initialize the OLED over I2C.
   *
   * Tries @p addr first, then 0x3D. On success the panel shows
   * "Display OK".
   *
   * @return true if the panel answered.
   */
  bool begin(int sda_pin, int scl_pin, uint8_t addr = 0x3C);

  /** @brief true once begin() succeeded. */
  bool available() const;

  /**
   * @brief Boot banner: fixed "PingNode" header, optional @p msg below it.
   * Null or empty @p msg is skipped.
   */
  void draw_boot(const char* msg);

  /**
   * @brief Identity screen: title, "NODE <local>" in large font, and the
   * destination address underneath.
   */
  void draw_id(uint8_t local_addr, uint8_t dest_addr);

  /** Render @p frame into the buffer (not yet visible). */
  void show(const NodeFrame& frame) override;

  /** Push the buffer to glass. */
  void refresh() override;
};
