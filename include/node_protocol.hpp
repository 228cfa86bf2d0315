#pragma once
/**
 * @page pn-node-protocol PingNode Host Link Transport (SLIP over Serial)
 * @file node_protocol.hpp
 * @brief Host link glue: SLIP framing on USB CDC, verb/tag contract, handler dispatch.
 *
 * Overview
 * --------
 * The host link is how a laptop on the USB cable talks to the node. It is
 * separate from the radio: nothing here goes on air. This module owns the
 * serial port with SLIP framing, turns the byte stream into complete inner
 * frames, and forwards them to one packet handler. Outbound, it SLIP-encodes
 * caller-built frames. It does not interpret tags or touch node state.
 *
 * Where It Sits
 * -------------
 * - Below: USB CDC and SLIP (PacketSerial).
 * - Above: node_interface.* (verb/TLV handling, config writes, events).
 *
 * Inner Frame Format (post-SLIP)
 * ------------------------------
 *   [0] verb      : uint8   operation code
 *   [1] flags     : uint8   reserved (0)
 *   [2] seq       : uint8   host-chosen; 0 marks unsolicited node frames
 *   [3] tlv_len   : uint8   number of bytes that follow
 *   [4..] TLVs    : tag(1) len(1) value(len), repeated
 *
 * Numbers are little-endian. Strings and payloads are raw bytes.
 *
 * Node-originated Frames
 * ----------------------
 * - RESP_OK seq=0 with TAG_NODE_ADDR at boot (hello).
 * - MSG: one trace line (built by node_interface_send_text()); raw text
 *   after the header.
 * - RX_EVENT: one received radio packet (source, destination, RSSI, payload).
 * - TX_EVENT: one transmitted radio packet (counter, payload).
 *
 * Field Notes
 * -----------
 * - The scheduler blocks for up to one receive timeout plus one dwell per
 *   loop() tick. PacketSerial buffers incoming bytes meanwhile; keep host
 *   requests small and paced.
 * - `pio device monitor --baud 115200` shows the raw SLIP stream; use the
 *   host tool to decode it.
 *
 * @author Leo
 */

#include <cstddef>
#include <cstdint>

/** Largest inner frame: 4-byte header plus a full 255-byte TLV block. */
static constexpr size_t NODE_PROTOCOL_MAX_FRAME = 4 + 255;


// -----------------------------------------------------------------------------
// Verbs (first byte of every inner frame)
// -----------------------------------------------------------------------------

/**
 * @enum Verb
 * @brief Operation codes for host link inner frames.
 */
enum Verb : uint8_t {
  /** @brief Ask the node for its radio address. */
  GET_ID    = 0x01,

  /** @brief Reachability check. Node responds with RESP_OK (+TAG_NODE_ADDR). */
  PING      = 0x03,

  /** @brief Read specific tags (send tags with len=0 to request values). */
  GET_PARAM = 0x10,

  /** @brief Write configuration tags. Validated as a set, persisted, next boot applies. */
  SET_PARAM = 0x11,

  /** @brief Read every identity, radio, schedule and diagnostic tag. */
  GET_ALL   = 0x12,

  // Node -> host, unsolicited (seq=0)
  /** @brief One trace line as raw text. */
  MSG       = 0x20,

  /** @brief A radio packet was received. */
  RX_EVENT  = 0x21,

  /** @brief A radio packet was transmitted. */
  TX_EVENT  = 0x22,

  // Standard response codes
  RESP_OK   = 0x90,
  RESP_ERR  = 0x91
};


// -----------------------------------------------------------------------------
// TLV Tags
// -----------------------------------------------------------------------------

/**
 * @enum Tag
 * @brief TLV identifiers (Identity, Radio, Schedule, Diagnostics, Events).
 */
enum Tag : uint8_t {
  // ---------------- Identity / System ----------------
  TAG_NODE_ADDR      = 0x01,   ///< local radio address (u8, 1..254)
  TAG_DEST_ADDR      = 0x02,   ///< destination address (u8, 255 = broadcast)
  TAG_FW_VERSION     = 0x03,   ///< firmware version string
  TAG_UPTIME_S       = 0x04,   ///< seconds since boot (u32)

  // ---------------- Radio (SX127x) ----------------
  TAG_FREQ_HZ        = 0x10,   ///< carrier frequency in Hz (u32)
  TAG_SF             = 0x11,   ///< spreading factor 7..12 (u8)
  TAG_BW_HZ          = 0x12,   ///< bandwidth in Hz (u32)
  TAG_CR             = 0x13,   ///< coding rate 5..8 => 4/5..4/8 (u8)
  TAG_TX_PWR_DBM     = 0x14,   ///< transmit power in dBm (i8)

  // ---------------- Schedule ----------------
  TAG_TX_INTERVAL_MS = 0x20,   ///< periodic transmit interval (u32)
  TAG_DWELL_MS       = 0x21,   ///< post-receive hold time (u32)
  TAG_RX_TIMEOUT_MS  = 0x22,   ///< receive poll timeout (u32)

  // ---------------- Diagnostics (read-only) ----------------
  TAG_RSSI_DBM       = 0x30,   ///< RSSI of the last received packet (i16)
  TAG_TX_COUNT       = 0x31,   ///< transmissions since boot, startup included (u32)
  TAG_RX_COUNT       = 0x32,   ///< packets received since boot (u32)
  TAG_ITERATIONS     = 0x33,   ///< scheduler iterations since boot (u32)
  TAG_MSG_COUNTER    = 0x34,   ///< message counter in the payload wording (u32)

  // ---------------- Event fields ----------------
  TAG_PAYLOAD        = 0x40,   ///< radio payload bytes
  TAG_SRC_ADDR       = 0x41    ///< source address from the radio header (u8)
};


// -----------------------------------------------------------------------------
// API (firmware: node_protocol.cpp)
// -----------------------------------------------------------------------------

/**
 * @brief Open the serial port and attach the SLIP decoder.
 * @param baud Baud rate for the USB CDC link.
 */
void node_protocol_begin(unsigned long baud = 115200);

/**
 * @brief Pump the SLIP decoder. Non-blocking; call every loop() tick.
 */
void node_protocol_update();

/**
 * @brief Install the inbound frame handler.
 *
 * @param handler Called with each decoded inner frame. nullptr restores the
 *        default, node_interface_on_packet().
 */
void node_protocol_set_handler(void (*handler)(const uint8_t* frame, size_t len));

/**
 * @brief SLIP-encode and write one complete inner frame.
 *
 * Dropped before node_protocol_begin() and for frames longer than
 * NODE_PROTOCOL_MAX_FRAME. Signature matches node_frame_sender_t.
 */
void protocol_send(const uint8_t* frame, size_t len);

