#pragma once
/**
 * @page pn-node-hal PingNode Capability Interfaces
 * @file node_hal.hpp
 * @brief The narrow seams between the scheduler and the hardware it drives.
 *
 * Overview
 * --------
 * The scheduler never touches SPI, I2C, GPIO or timers. It sees four small
 * capabilities and nothing else:
 *
 *   NodeRadio      transmit bytes, receive bytes with a timeout, last RSSI
 *   NodeDisplay    show a frame of positioned text lines, flush to glass
 *   NodeIndicator  one boolean light
 *   NodeClock      monotonic milliseconds and a blocking sleep
 *
 * Firmware implements them on top of LoRa / Adafruit_SSD1306 / Arduino
 * (node_radio.*, node_display.*, node_board.*). Host tests
 * implement them as fakes. Keep these classes free of third-party types so
 * the scheduler builds anywhere.
 *
 * Data Types
 * ----------
 * - NodePayload: opaque bytes. Radio payloads are free text by convention,
 *   but nothing here parses them.
 * - NodeFrame: a background and zero or more text lines. Rebuilt every
 *   iteration; there is no diffing against the previous frame.
 * - NodeInboundPacket: 4-byte header, payload, RSSI. Lives for one
 *   iteration.
 *
 * @author Leo
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/** Radio payload bytes. No schema; free text by convention. */
typedef std::vector<uint8_t> NodePayload;

/** Header layout prepended by the radio on every packet. */
static constexpr size_t NODE_HEADER_LEN = 4;

/** Destination address that every node accepts. */
static constexpr uint8_t NODE_BROADCAST_ADDR = 0xFF;

/**
 * @brief Four header bytes as they appear on air: [dest][src][id][flags].
 */
struct NodePacketHeader {
  uint8_t dest  = 0;
  uint8_t src   = 0;
  uint8_t id    = 0;
  uint8_t flags = 0;
};

/** One received packet, split into header and payload, plus its RSSI. */
struct NodeInboundPacket {
  NodePacketHeader header;
  NodePayload      payload;
  int16_t          rssi = 0;
};

/** A single line of text placed at a pixel position. */
struct NodeTextLine {
  int16_t     x = 0;
  int16_t     y = 0;
  std::string text;
};

/** Monochrome background values for NodeFrame::background. */
enum NodeColor : uint8_t {
  NODE_COLOR_BLACK = 0,
  NODE_COLOR_WHITE = 1
};

/**
 * @brief A render target rebuilt from scratch every iteration.
 *
 * Text is always drawn in the color opposite the background.
 */
struct NodeFrame {
  uint8_t                   background = NODE_COLOR_BLACK;
  std::vector<NodeTextLine> lines;
};

/**
 * @brief Addressed packet radio.
 *
 * Implementations own the header format. A fault inside send() or receive()
 * is not reported back to the caller; adapters treat it as fatal.
 */
class NodeRadio {
public:
  virtual ~NodeRadio() {}

  /**
   * @brief Transmit @p payload to @p dest.
   * @param keep_listening Return to receive mode after the send completes.
   */
  virtual void send(uint8_t dest, const NodePayload& payload, bool keep_listening) = 0;

  /**
   * @brief Wait up to @p timeout_ms for one packet.
   *
   * @param with_header When true, @p out starts with the 4 header bytes.
   * @param out         Filled with the packet bytes on success.
   * @return false when nothing arrived. That is a normal outcome.
   */
  virtual bool receive(bool with_header, uint32_t timeout_ms, NodePayload& out) = 0;

  /** RSSI in dBm of the last packet returned by receive(). */
  virtual int16_t last_rssi() const = 0;
};

/** Text display sink. */
class NodeDisplay {
public:
  virtual ~NodeDisplay() {}

  /** Replace the pending screen contents with @p frame. */
  virtual void show(const NodeFrame& frame) = 0;

  /** Push pending contents to the panel. */
  virtual void refresh() = 0;
};

/** Single on/off activity light. */
class NodeIndicator {
public:
  virtual ~NodeIndicator() {}
  virtual void set(bool on) = 0;
};

/** Monotonic time source. now_ms() may wrap; callers use unsigned deltas. */
class NodeClock {
public:
  virtual ~NodeClock() {}
  virtual uint32_t now_ms() = 0;
  virtual void sleep_ms(uint32_t ms) = 0;
};
