#pragma once
/**
 * @page pn-node-radio PingNode Radio (SX127x via LoRa)
 * @file node_radio.hpp
 * @brief NodeRadio on an SX1276/SX1278 using the Arduino LoRa library.
 *
 * Overview
 * --------
 * Raw LoRa packets with a 4-byte address header in front of the payload:
 *
 *   [0] dest    destination address (255 = broadcast)
 *   [1] src     our address
 *   [2] id      per-node rolling sequence byte
 *   [3] flags   0
 *   [4..]       payload, at most 251 bytes
 *
 * This is the same header layout the RadioHead-style RFM9x drivers put on
 * air, so nodes running those drivers can talk to this one.
 *
 * Receive is a poll on parsePacket() bounded by the caller's timeout. No
 * address filtering happens here; every packet with a good CRC goes up.
 *
 * Failure Modes
 * -------------
 * - begin() returns false if the chip does not answer. The caller treats
 *   that as fatal.
 * - A send the chip refuses (still busy transmitting) is fatal: a [FATAL]
 *   line is logged and the node halts. There is no retry path.
 *
 * Do not leak LoRa library types through this header.
 *
 * @author Leo
 */

#include "node_hal.hpp"
#include "node_config.hpp"

#include <cstdint>

/** SPI and control pins for the radio. */
struct NodeRadioPins {
  int sck;
  int miso;
  int mosi;
  int ss;
  int rst;
  int dio0;
};

class LoRaNodeRadio : public NodeRadio {
public:
  explicit LoRaNodeRadio(const NodeRadioPins& pins);

  /**
   * @brief Bring up SPI and the radio with @p cfg's RF parameters.
   * @return false if the chip did not respond.
   */
  bool begin(const NodeConfig& cfg);

  void send(uint8_t dest, const NodePayload& payload, bool keep_listening) override;
  bool receive(bool with_header, uint32_t timeout_ms, NodePayload& out) override;
  int16_t last_rssi() const override { return last_rssi_; }

private:
  NodeRadioPins pins_;
  uint8_t       local_addr_;
  uint8_t       seq_;
  int16_t       last_rssi_;
};
