/**
 * @page pn-node-main PingNode Entry (TTGO LoRa32 V2.1 / 1.6.x)
 * @file main.cpp
 * @brief Entry point: wire up host link, config, display, radio; then run the scheduler.
 *
 * Purpose
 * -------
 * This file is intentionally boring. It builds the hardware adapters, loads
 * configuration, and hands control to the cooperative scheduler. All
 * behavior lives in modules that are tested on the host.
 *
 * What This File Does
 * -------------------
 * 1) Host link: SLIP over USB CDC (node_protocol.*), frames routed to
 *    node_interface.*; trace lines go out as MSG frames.
 * 2) Configuration from NVS (node_config_nvs.*), defaults if absent.
 * 3) Optional OLED: boot banner and node identity (node_display.*).
 * 4) Radio bring-up (node_radio.*). Failure here is fatal.
 * 5) Scheduler context, RX/TX events to the host, hello frame, startup
 *    broadcast (node_scheduler.*).
 * 6) loop(): pump the host link, run one scheduler iteration.
 *
 * Operational Notes
 * -----------------
 * - Two boards: give the second one node 2 / dest 1 over the host link
 *   (SET_PARAM) and reboot it.
 * - Headless: if the OLED is missing, everything else still runs.
 *
 * Example Bring-Up (Host)
 * -----------------------
 *   pio run -t upload
 *   pio device monitor --baud 115200
 *
 * @author Leo
 */

#include <Arduino.h>
#include "node_protocol.hpp"    // node_protocol_begin/update, protocol_send
#include "node_interface.hpp"   // config, verb handling, RX/TX event frames
#include "node_config_nvs.hpp"  // NvsConfigStore
#include "node_display.hpp"     // Ssd1306NodeDisplay
#include "node_radio.hpp"       // LoRaNodeRadio
#include "node_board.hpp"       // pins, LED, clock
#include "node_scheduler.hpp"   // NodeContext, start/step
#include "node_log.hpp"         // node_log_set_sink

static NvsConfigStore     g_store;
static Ssd1306NodeDisplay g_display;
static LoRaNodeRadio      g_radio(BOARD_RADIO_PINS);
static GpioNodeIndicator  g_led(BOARD_LED_PIN);
static ArduinoNodeClock   g_clock;

static NodeContext*       g_ctx = nullptr;

void setup() {
  // 1) Host link and logging
  node_protocol_begin(115200);
  node_protocol_set_handler(node_interface_on_packet);
  node_interface_set_sender(protocol_send);
  node_log_set_sink(node_interface_send_text);

  // 2) Configuration
  node_interface_begin(g_store);
  const NodeConfig& cfg = node_interface_config();

  // 3) Display (tries 0x3C, then 0x3D)
  g_display.begin(BOARD_I2C_SDA_PIN, BOARD_I2C_SCL_PIN, BOARD_OLED_ADDR);
  if (g_display.available()) {
    g_display.draw_boot("Booting...");
  } else {
    node_log("BOOT", "no OLED, running headless");
  }

  // 4) Indicator + radio
  g_led.begin();
  if (!g_radio.begin(cfg)) {
    g_display.draw_boot("LoRa init FAILED");
    node_log("FATAL", "LoRa init failed at %lu Hz", static_cast<unsigned long>(cfg.freq_hz));
    for (;;) delay(1000);
  }
  g_display.draw_id(cfg.node_addr, cfg.dest_addr);

  // 5) Scheduler context, host events, announce
  static NodeContext ctx(g_radio, g_display, g_led, g_clock,
                         node_identity_from(cfg), node_schedule_from(cfg));
  ctx.on_receive  = node_interface_report_rx;
  ctx.on_transmit = node_interface_report_tx;
  node_interface_bind(&ctx);
  g_ctx = &ctx;

  node_interface_send_hello();
  node_scheduler_start(ctx);
}

void loop() {
  node_protocol_update();
  node_scheduler_step(*g_ctx);
}
