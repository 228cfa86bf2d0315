#include <gtest/gtest.h>

#include "node_message.hpp"

#include <string>

static std::string str(const NodePayload& p) { return std::string(p.begin(), p.end()); }

TEST(NodeMessage, StartupWording) {
  EXPECT_EQ("Startup message 0 from node 1", str(node_message_startup(0, 1)));
  EXPECT_EQ("Startup message 7 from node 254", str(node_message_startup(7, 254)));
}

TEST(NodeMessage, PeriodicWording) {
  EXPECT_EQ("msg num 1 node 2", str(node_message_periodic(1, 2)));
  EXPECT_EQ("msg num 4294967295 node 1", str(node_message_periodic(0xFFFFFFFFu, 1)));
}

TEST(NodeMessage, PayloadHasNoTrailingNul) {
  NodePayload p = node_message_periodic(3, 1);
  ASSERT_FALSE(p.empty());
  EXPECT_NE(0, p.back());
}

TEST(NodeMessage, PayloadRendersAsBytesLiteral) {
  std::string s = "hello";
  EXPECT_EQ("b'hello'", node_message_payload_text(NodePayload(s.begin(), s.end())));

  std::string t = "hello, world ~!";
  EXPECT_EQ("b'hello, world ~!'", node_message_payload_text(NodePayload(t.begin(), t.end())));
}

TEST(NodeMessage, NonPrintableBytesAreEscaped) {
  NodePayload p;
  p.push_back('a');
  p.push_back(0x00);
  p.push_back(0x1B);
  p.push_back(0x7F);
  p.push_back(0x80);
  p.push_back(0xFF);
  p.push_back('b');
  EXPECT_EQ("b'a\\x00\\x1b\\x7f\\x80\\xffb'", node_message_payload_text(p));
}

TEST(NodeMessage, WhitespaceControlsUseShortEscapes) {
  NodePayload p;
  p.push_back('\t');
  p.push_back('x');
  p.push_back('\n');
  p.push_back('\r');
  EXPECT_EQ("b'\\tx\\n\\r'", node_message_payload_text(p));
}

TEST(NodeMessage, BackslashIsEscaped) {
  std::string s = "a\\b";
  EXPECT_EQ("b'a\\\\b'", node_message_payload_text(NodePayload(s.begin(), s.end())));
}

TEST(NodeMessage, QuoteSelection) {
  std::string only_single = "it's";
  EXPECT_EQ("b\"it's\"", node_message_payload_text(NodePayload(only_single.begin(), only_single.end())));

  std::string both = "'\"";
  EXPECT_EQ("b'\\'\"'", node_message_payload_text(NodePayload(both.begin(), both.end())));

  std::string only_double = "say \"hi\"";
  EXPECT_EQ("b'say \"hi\"'", node_message_payload_text(NodePayload(only_double.begin(), only_double.end())));
}

TEST(NodeMessage, EmptyPayloadIsEmptyLiteral) {
  EXPECT_EQ("b''", node_message_payload_text(NodePayload()));
}

TEST(NodeMessage, RssiLine) {
  EXPECT_EQ("RSSI: -42", node_message_rssi_text(-42));
  EXPECT_EQ("RSSI: 0", node_message_rssi_text(0));
  EXPECT_EQ("RSSI: -137", node_message_rssi_text(-137));
}

TEST(NodeMessage, HeaderHex) {
  NodePacketHeader h;
  h.dest = 0xFF; h.src = 0x01; h.id = 0x2A; h.flags = 0x00;
  EXPECT_EQ("ff 01 2a 00", node_message_header_hex(h));
}

TEST(NodeMessage, SplitSeparatesHeaderAndPayload) {
  NodePayload raw;
  raw.push_back(2); raw.push_back(1); raw.push_back(9); raw.push_back(0x80);
  raw.push_back('h'); raw.push_back('i');

  NodeInboundPacket pkt;
  pkt.rssi = -12;
  node_message_split(raw, pkt);

  EXPECT_EQ(2, pkt.header.dest);
  EXPECT_EQ(1, pkt.header.src);
  EXPECT_EQ(9, pkt.header.id);
  EXPECT_EQ(0x80, pkt.header.flags);
  EXPECT_EQ("hi", str(pkt.payload));
  EXPECT_EQ(-12, pkt.rssi);
}

TEST(NodeMessage, SplitHeaderOnlyPacket) {
  NodePayload raw(4, 0x05);
  NodeInboundPacket pkt;
  pkt.payload.push_back('x');
  node_message_split(raw, pkt);
  EXPECT_EQ(5, pkt.header.flags);
  EXPECT_TRUE(pkt.payload.empty());
}

TEST(NodeMessage, SplitShortPacketZeroFillsHeader) {
  NodePayload raw;
  raw.push_back(3);
  NodeInboundPacket pkt;
  node_message_split(raw, pkt);
  EXPECT_EQ(3, pkt.header.dest);
  EXPECT_EQ(0, pkt.header.src);
  EXPECT_EQ(0, pkt.header.id);
  EXPECT_EQ(0, pkt.header.flags);
  EXPECT_TRUE(pkt.payload.empty());
}
