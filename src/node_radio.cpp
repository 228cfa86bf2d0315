/**
 * @file node_radio.cpp
 * @brief Implementation for node_radio.hpp (SX127x over SPI).
 *
 * Notes:
 * - Header layout and failure policy are documented in node_radio.hpp.
 * - Single radio on the board; the LoRa library keeps its own global.
 */

#include "node_radio.hpp"
#include "node_log.hpp"

/* Arduino core (millis, delay). Repo (ESP32 core): https://github.com/espressif/arduino-esp32 */
#include <Arduino.h>
#include <SPI.h>

/* SX127x driver. Repo: https://github.com/sandeepmistry/arduino-LoRa */
#include <LoRa.h>

namespace {
constexpr size_t kMaxPacket = 255;   // SX127x FIFO payload limit

// Fatal radio fault: say so once, then stop. The watchdog or a human resets.
[[noreturn]] void halt(const char* why) {
  node_log("FATAL", "%s", why);
  for (;;) delay(1000);
}
} // namespace

LoRaNodeRadio::LoRaNodeRadio(const NodeRadioPins& pins)
    : pins_(pins), local_addr_(0), seq_(0), last_rssi_(0) {}

/*------------------------------------------------------------------------------
  begin
  -----
  Phases:
  1) SPI on the board's pins, then hand CS/RST/DIO0 to the driver.
  2) LoRa.begin() resets the chip and checks its version register.
  3) Apply RF parameters from config and enable CRC so corrupted packets
     never reach parsePacket().
------------------------------------------------------------------------------*/
bool LoRaNodeRadio::begin(const NodeConfig& cfg) {
  local_addr_ = cfg.node_addr;

  SPI.begin(pins_.sck, pins_.miso, pins_.mosi, pins_.ss);
  LoRa.setPins(pins_.ss, pins_.rst, pins_.dio0);
  if (!LoRa.begin(static_cast<long>(cfg.freq_hz))) return false;

  LoRa.setSpreadingFactor(cfg.sf);
  LoRa.setSignalBandwidth(static_cast<long>(cfg.bw_hz));
  LoRa.setCodingRate4(cfg.cr);
  LoRa.setTxPower(cfg.tx_pwr_dbm);
  LoRa.enableCrc();
  return true;
}

/*------------------------------------------------------------------------------
  send
  ----
  Blocking transmit of [dest][src][id][flags] + payload. Payloads longer
  than the FIFO allows are clipped. With keep_listening the chip goes back
  to continuous receive right after TxDone; otherwise it idles until the
  next receive() call.
------------------------------------------------------------------------------*/
void LoRaNodeRadio::send(uint8_t dest, const NodePayload& payload, bool keep_listening) {
  uint8_t header[NODE_HEADER_LEN] = { dest, local_addr_, seq_++, 0 };

  size_t n = payload.size();
  if (n > kMaxPacket - NODE_HEADER_LEN) n = kMaxPacket - NODE_HEADER_LEN;

  if (!LoRa.beginPacket()) halt("radio busy, send refused");
  LoRa.write(header, sizeof(header));
  if (n) LoRa.write(&payload[0], n);
  LoRa.endPacket();                            // blocks until TxDone

  if (keep_listening) {
    LoRa.receive();
  } else {
    LoRa.idle();
  }
}

/*------------------------------------------------------------------------------
  receive
  -------
  Poll parsePacket() until a packet shows up or timeout_ms passes. A zero
  timeout is a single poll. Unsigned millis() arithmetic survives wrap.
------------------------------------------------------------------------------*/
bool LoRaNodeRadio::receive(bool with_header, uint32_t timeout_ms, NodePayload& out) {
  const uint32_t start = millis();

  for (;;) {
    int size = LoRa.parsePacket();
    if (size > 0) {
      out.clear();
      out.reserve(static_cast<size_t>(size));
      while (LoRa.available()) {
        out.push_back(static_cast<uint8_t>(LoRa.read()));
      }
      last_rssi_ = static_cast<int16_t>(LoRa.packetRssi());

      if (!with_header) {
        size_t strip = out.size() < NODE_HEADER_LEN ? out.size() : NODE_HEADER_LEN;
        out.erase(out.begin(), out.begin() + strip);
      }
      return true;
    }

    if (static_cast<uint32_t>(millis() - start) >= timeout_ms) return false;
    delay(1);
  }
}
