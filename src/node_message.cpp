// node_message.cpp - implementation for node_message.hpp

#include "node_message.hpp"

#include <cstdio>               // snprintf

// Copy a formatted C string into a payload (no trailing NUL on the air).
static NodePayload to_payload(const char* s, int n) {
  if (n <= 0) return NodePayload();
  return NodePayload(s, s + n);
}

// Fixed-format wordings: snprintf into a stack buffer, length clamped to it.
NodePayload node_message_startup(uint32_t counter, uint8_t local_addr) {
  char b[48];
  int n = snprintf(b, sizeof(b), "Startup message %lu from node %u",
                   static_cast<unsigned long>(counter), static_cast<unsigned>(local_addr));
  if (n >= static_cast<int>(sizeof(b))) n = sizeof(b) - 1;
  return to_payload(b, n);
}

NodePayload node_message_periodic(uint32_t counter, uint8_t local_addr) {
  char b[40];
  int n = snprintf(b, sizeof(b), "msg num %lu node %u",
                   static_cast<unsigned long>(counter), static_cast<unsigned>(local_addr));
  if (n >= static_cast<int>(sizeof(b))) n = sizeof(b) - 1;
  return to_payload(b, n);
}

//
// node_message_payload_text()
// ---------------------------
// Bytes literal notation, the same text a Python receiver prints for the
// packet: b'hello', b'', b'a\nb\x00'.
//
// Phases:
//   1) Pick the quote. Single quotes, unless the bytes hold a ' and no ".
//   2) One pass over the bytes:
//        - backslash and the chosen quote get a backslash in front
//        - \t \n \r use their short escapes
//        - other bytes outside 0x20..0x7E become \xNN (lowercase hex)
//        - everything else is copied through
//   3) Close the quote.
//
std::string node_message_payload_text(const NodePayload& payload) {
  static const char kHex[] = "0123456789abcdef";

  // 1) quote choice
  bool has_single = false, has_double = false;
  for (size_t i = 0; i < payload.size(); ++i) {
    if (payload[i] == '\'') has_single = true;
    if (payload[i] == '"')  has_double = true;
  }
  const char quote = (has_single && !has_double) ? '"' : '\'';

  std::string out;
  out.reserve(payload.size() + 3);
  out.push_back('b');
  out.push_back(quote);

  // 2) body
  for (size_t i = 0; i < payload.size(); ++i) {
    uint8_t c = payload[i];
    if (c == '\\' || c == static_cast<uint8_t>(quote)) {
      out.push_back('\\');
      out.push_back(static_cast<char>(c));
    } else if (c == '\t') {
      out += "\\t";
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c < 0x20 || c > 0x7E) {
      out.push_back('\\');
      out.push_back('x');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    } else {
      out.push_back(static_cast<char>(c));
    }
  }

  // 3) close
  out.push_back(quote);
  return out;
}

std::string node_message_rssi_text(int16_t rssi) {
  char b[16];
  snprintf(b, sizeof(b), "RSSI: %d", static_cast<int>(rssi));
  return std::string(b);
}

std::string node_message_header_hex(const NodePacketHeader& header) {
  char b[16];
  snprintf(b, sizeof(b), "%02x %02x %02x %02x",
           header.dest, header.src, header.id, header.flags);
  return std::string(b);
}

//
// node_message_split()
// --------------------
// Phases:
//   1) Zero the header, then fill as many of its four bytes as arrived.
//   2) Whatever follows the header is payload; a header-only or short
//      packet leaves the payload empty.
// RSSI belongs to the radio, not the bytes, so it is left alone.
//
void node_message_split(const NodePayload& raw, NodeInboundPacket& packet) {
  // 1) header
  packet.header = NodePacketHeader();
  size_t n = raw.size();
  if (n > 0) packet.header.dest  = raw[0];
  if (n > 1) packet.header.src   = raw[1];
  if (n > 2) packet.header.id    = raw[2];
  if (n > 3) packet.header.flags = raw[3];

  // 2) payload
  if (n > NODE_HEADER_LEN) {
    packet.payload.assign(raw.begin() + NODE_HEADER_LEN, raw.end());
  } else {
    packet.payload.clear();
  }
}
