/**
 * @file node_display.cpp
 * @brief Ssd1306NodeDisplay on the Adafruit driver.
 *
 * Notes:
 * - Frame semantics (background, contrasting text, positioned lines) are in
 *   node_display.hpp and node_hal.hpp.
 * - Every entry point is a no-op until begin() has found a panel.
 */

#include "node_display.hpp"     // Ssd1306NodeDisplay; no Adafruit types in the header

/* Arduino I2C core (ESP32/Arduino). Repo (ESP32 core): https://github.com/espressif/arduino-esp32 */
#include <Wire.h>               // TwoWire / I2C bus access

/* Graphics primitives. Repo: https://github.com/adafruit/Adafruit-GFX-Library */
#include <Adafruit_GFX.h>       // Text, fills, coordinate space

/* SSD1306 panel driver. Repo: https://github.com/adafruit/Adafruit_SSD1306 */
#include <Adafruit_SSD1306.h>   // 128x64 OLED control (buffered)

/*------------------------------------------------------------------------------
  Internal state
  --------------
  Concrete driver types stay in an anonymous namespace so nothing outside this
  file sees Adafruit headers. One panel per node, so one global driver.
------------------------------------------------------------------------------*/
namespace {
constexpr int  kWidth  = 128;   // Physical panel width (columns)
constexpr int  kHeight = 64;    // Physical panel height (rows)
constexpr int  kReset  = -1;    // No dedicated reset pin on TTGO

Adafruit_SSD1306 g_display(kWidth, kHeight, &Wire, kReset);

// Set once begin() finds a panel at either address.
bool g_ok = false;
} // namespace

/*------------------------------------------------------------------------------
  begin
  -----
  Phases:
  1) Start I2C on provided pins.
  2) Try primary address; if that fails and isn't already 0x3D, try 0x3D.
  3) If up, set defaults, paint a one-shot status, and latch g_ok.
------------------------------------------------------------------------------*/
bool Ssd1306NodeDisplay::begin(int sda_pin, int scl_pin, uint8_t addr) {
  Wire.begin(sda_pin, scl_pin);

  g_ok = g_display.begin(SSD1306_SWITCHCAPVCC, addr);
  if (!g_ok && addr != 0x3D) {
    g_ok = g_display.begin(SSD1306_SWITCHCAPVCC, 0x3D);
  }

  if (g_ok) {
    g_display.clearDisplay();
    g_display.setTextColor(SSD1306_WHITE);
    g_display.setTextSize(1);
    g_display.setTextWrap(false);               // lines clip at the edge, never reflow
    g_display.setCursor(0, 0);
    g_display.println(F("Display OK"));
    g_display.display();
  }
  return g_ok;
}

bool Ssd1306NodeDisplay::available() const {
  return g_ok;
}

void Ssd1306NodeDisplay::draw_boot(const char* msg) {
  if (!g_ok) return;
  g_display.clearDisplay();
  g_display.setTextColor(SSD1306_WHITE);
  g_display.setTextSize(1);
  g_display.setCursor(0, 0);
  g_display.println(F("PingNode"));
  if (msg && *msg) {
    g_display.setCursor(0, 12);                 // Next text row (8px font + spacing).
    g_display.println(msg);
  }
  g_display.display();
}

/*------------------------------------------------------------------------------
  draw_id
  -------
  Three rows: title (small), node address (large, readable at arm's length),
  destination (small). Fixed positions; no centering.
------------------------------------------------------------------------------*/
void Ssd1306NodeDisplay::draw_id(uint8_t local_addr, uint8_t dest_addr) {
  if (!g_ok) return;
  g_display.clearDisplay();
  g_display.setTextColor(SSD1306_WHITE);

  g_display.setTextSize(1);
  g_display.setCursor(0, 0);
  g_display.println(F("PingNode"));

  g_display.setTextSize(2);
  g_display.setCursor(0, 16);
  g_display.print(F("NODE "));
  g_display.print(local_addr);

  g_display.setTextSize(1);
  g_display.setCursor(0, 40);
  g_display.print(F("-> "));
  if (dest_addr == NODE_BROADCAST_ADDR) {
    g_display.print(F("broadcast"));
  } else {
    g_display.print(dest_addr);
  }
  g_display.display();
}

/*------------------------------------------------------------------------------
  show
  ----
  Phases:
  1) Paint the background over the whole buffer.
  2) Draw each line at its own cursor, small font, in the contrasting color.
  The buffer is not pushed here; refresh() does that.
------------------------------------------------------------------------------*/
void Ssd1306NodeDisplay::show(const NodeFrame& frame) {
  if (!g_ok) return;
  const bool white_bg = frame.background == NODE_COLOR_WHITE;

  g_display.fillScreen(white_bg ? SSD1306_WHITE : SSD1306_BLACK);
  g_display.setTextColor(white_bg ? SSD1306_BLACK : SSD1306_WHITE);
  g_display.setTextSize(1);
  g_display.setTextWrap(false);

  for (size_t i = 0; i < frame.lines.size(); ++i) {
    const NodeTextLine& line = frame.lines[i];
    g_display.setCursor(line.x, line.y);
    g_display.print(line.text.c_str());
  }
}

void Ssd1306NodeDisplay::refresh() {
  if (!g_ok) return;
  g_display.display();
}
