#pragma once
/**
 * @file node_message.hpp
 * @brief Payload strings the node sends and the text lines it draws.
 *
 * Everything here is pure string work with no I/O. The radio payloads are
 * free text; these helpers are the only place their wording lives.
 *
 *   node_message_startup(0, 1)   -> "Startup message 0 from node 1"
 *   node_message_periodic(3, 1)  -> "msg num 3 node 1"
 *   node_message_rssi_text(-42)  -> "RSSI: -42"
 *   node_message_payload_text("hello") -> "b'hello'"
 */

#include "node_hal.hpp"

#include <cstdint>
#include <string>

/** Liveness announcement sent once at boot. */
NodePayload node_message_startup(uint32_t counter, uint8_t local_addr);

/** Counter-stamped message sent every transmit interval. */
NodePayload node_message_periodic(uint32_t counter, uint8_t local_addr);

/**
 * @brief Render opaque payload bytes as one display/log line.
 *
 * Bytes literal form, as a Python receiver prints the same packet:
 * "hello" renders as b'hello', an empty payload as b''. Backslash and the
 * quote are escaped, tab/newline/CR use \t \n \r, and any other byte
 * outside 0x20..0x7E becomes \xNN in lowercase hex. A payload holding ' but
 * no " is wrapped in double quotes instead. Content is not otherwise
 * validated.
 */
std::string node_message_payload_text(const NodePayload& payload);

/** "RSSI: <dBm>" */
std::string node_message_rssi_text(int16_t rssi);

/** Header bytes as "dd ss ii ff" for trace output. */
std::string node_message_header_hex(const NodePacketHeader& header);

/**
 * @brief Split raw received bytes into header and payload.
 *
 * The first NODE_HEADER_LEN bytes fill the header in [dest][src][id][flags]
 * order; the rest is payload. Short packets leave missing header fields at 0
 * and produce an empty payload. RSSI is left untouched.
 */
void node_message_split(const NodePayload& raw, NodeInboundPacket& packet);
