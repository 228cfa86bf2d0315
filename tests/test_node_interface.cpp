// Host link verb handling and event frames, driven with hand-built frames.

#include <gtest/gtest.h>

#include "node_fakes.hpp"
#include "node_interface.hpp"
#include "node_protocol.hpp"
#include "node_scheduler.hpp"

#include <cstring>
#include <string>
#include <vector>

namespace {

typedef std::vector<uint8_t> Bytes;

std::vector<Bytes> g_frames;
void capture_frame(const uint8_t* frame, size_t len) {
  g_frames.push_back(Bytes(frame, frame + len));
}

class MemoryStore : public NodeConfigStore {
public:
  MemoryStore() : fail_save(false), saves(0) {}

  bool load(NodeConfig& cfg) override {
    cfg = data;
    return true;
  }
  bool save(const NodeConfig& cfg) override {
    if (fail_save) return false;
    data = cfg;
    ++saves;
    return true;
  }

  NodeConfig data;
  bool       fail_save;
  int        saves;
};

// [verb][0][seq][len] + body
Bytes frame(uint8_t verb, uint8_t seq, const Bytes& body = Bytes()) {
  Bytes b;
  b.push_back(verb);
  b.push_back(0);
  b.push_back(seq);
  b.push_back(static_cast<uint8_t>(body.size()));
  b.insert(b.end(), body.begin(), body.end());
  return b;
}

void tlv_u8(Bytes& b, uint8_t tag, uint8_t v) {
  b.push_back(tag); b.push_back(1); b.push_back(v);
}

void tlv_u32(Bytes& b, uint8_t tag, uint32_t v) {
  b.push_back(tag); b.push_back(4);
  for (int j = 0; j < 4; ++j) b.push_back(static_cast<uint8_t>(v >> (8 * j)));
}

// Locate `tag` in a response frame; returns value bytes or empty.
Bytes find_tlv(const Bytes& f, uint8_t tag, bool* found = nullptr) {
  if (found) *found = false;
  size_t off = 4, end = 4 + f[3];
  while (off + 2 <= end) {
    uint8_t t = f[off++];
    uint8_t L = f[off++];
    if (t == tag) {
      if (found) *found = true;
      return Bytes(f.begin() + off, f.begin() + off + L);
    }
    off += L;
  }
  return Bytes();
}

uint32_t le32(const Bytes& v) {
  uint32_t x = 0;
  for (size_t j = 0; j < v.size(); ++j) x |= static_cast<uint32_t>(v[j]) << (8 * j);
  return x;
}

class InterfaceTest : public ::testing::Test {
protected:
  void SetUp() override {
    g_frames.clear();
    node_interface_begin(store);
    node_interface_set_sender(capture_frame);
  }

  void TearDown() override { node_interface_set_sender(nullptr); }

  void deliver(const Bytes& f) { node_interface_on_packet(&f[0], f.size()); }

  MemoryStore store;
};

} // namespace

TEST_F(InterfaceTest, PingAnswersWithNodeAddress) {
  deliver(frame(Verb::PING, 7));

  ASSERT_EQ(1u, g_frames.size());
  Bytes expect;
  expect.push_back(Verb::RESP_OK); expect.push_back(0); expect.push_back(7); expect.push_back(3);
  expect.push_back(TAG_NODE_ADDR); expect.push_back(1); expect.push_back(1);
  EXPECT_EQ(expect, g_frames[0]);
}

TEST_F(InterfaceTest, HelloIsUnsolicited) {
  node_interface_send_hello();
  ASSERT_EQ(1u, g_frames.size());
  EXPECT_EQ(Verb::RESP_OK, g_frames[0][0]);
  EXPECT_EQ(0, g_frames[0][2]);
  EXPECT_EQ(Bytes(1, 1), find_tlv(g_frames[0], TAG_NODE_ADDR));
}

TEST_F(InterfaceTest, GetParamReturnsRequestedTags) {
  Bytes body;
  body.push_back(TAG_SF); body.push_back(0);
  body.push_back(TAG_TX_INTERVAL_MS); body.push_back(0);
  deliver(frame(Verb::GET_PARAM, 3, body));

  ASSERT_EQ(1u, g_frames.size());
  const Bytes& r = g_frames[0];
  EXPECT_EQ(Verb::RESP_OK, r[0]);
  EXPECT_EQ(3, r[2]);
  EXPECT_EQ(Bytes(1, 7), find_tlv(r, TAG_SF));
  EXPECT_EQ(1000u, le32(find_tlv(r, TAG_TX_INTERVAL_MS)));

  bool found = true;
  find_tlv(r, TAG_FREQ_HZ, &found);
  EXPECT_FALSE(found);
}

TEST_F(InterfaceTest, SetParamPersistsAndEchoes) {
  Bytes body;
  tlv_u8(body, TAG_NODE_ADDR, 2);
  tlv_u8(body, TAG_DEST_ADDR, 1);
  tlv_u32(body, TAG_TX_INTERVAL_MS, 2000);
  deliver(frame(Verb::SET_PARAM, 9, body));

  ASSERT_EQ(1u, g_frames.size());
  const Bytes& r = g_frames[0];
  EXPECT_EQ(Verb::RESP_OK, r[0]);
  EXPECT_EQ(Bytes(1, 2), find_tlv(r, TAG_NODE_ADDR));
  EXPECT_EQ(Bytes(1, 1), find_tlv(r, TAG_DEST_ADDR));
  EXPECT_EQ(2000u, le32(find_tlv(r, TAG_TX_INTERVAL_MS)));
  EXPECT_EQ(500u, le32(find_tlv(r, TAG_DWELL_MS)));

  EXPECT_EQ(1, store.saves);
  EXPECT_EQ(2, store.data.node_addr);
  EXPECT_EQ(2, node_interface_stored_config().node_addr);
  EXPECT_EQ(2000u, node_interface_stored_config().tx_interval_ms);

  // The running config is what the node booted with.
  EXPECT_EQ(1, node_interface_config().node_addr);
  EXPECT_EQ(1000u, node_interface_config().tx_interval_ms);
}

TEST_F(InterfaceTest, SetParamOutOfRangeChangesNothing) {
  Bytes body;
  tlv_u8(body, TAG_NODE_ADDR, 5);
  tlv_u8(body, TAG_SF, 13);
  deliver(frame(Verb::SET_PARAM, 4, body));

  ASSERT_EQ(1u, g_frames.size());
  EXPECT_EQ(Verb::RESP_ERR, g_frames[0][0]);
  EXPECT_EQ(4, g_frames[0][2]);
  EXPECT_EQ(0, store.saves);
  EXPECT_EQ(1, node_interface_stored_config().node_addr);
}

TEST_F(InterfaceTest, SetParamRejectsDwellNotBelowInterval) {
  Bytes body;
  tlv_u32(body, TAG_DWELL_MS, 1000);
  deliver(frame(Verb::SET_PARAM, 1, body));

  ASSERT_EQ(1u, g_frames.size());
  EXPECT_EQ(Verb::RESP_ERR, g_frames[0][0]);
  EXPECT_EQ(500u, node_interface_stored_config().dwell_ms);

  // Raising the interval in the same request makes it acceptable.
  g_frames.clear();
  Bytes both;
  tlv_u32(both, TAG_TX_INTERVAL_MS, 5000);
  tlv_u32(both, TAG_DWELL_MS, 1000);
  deliver(frame(Verb::SET_PARAM, 2, both));
  ASSERT_EQ(1u, g_frames.size());
  EXPECT_EQ(Verb::RESP_OK, g_frames[0][0]);
  EXPECT_EQ(1000u, node_interface_stored_config().dwell_ms);
}

TEST_F(InterfaceTest, SetParamWrongWidthIsRejected) {
  Bytes body;
  body.push_back(TAG_FREQ_HZ); body.push_back(2); body.push_back(0); body.push_back(0);
  deliver(frame(Verb::SET_PARAM, 1, body));

  ASSERT_EQ(1u, g_frames.size());
  EXPECT_EQ(Verb::RESP_ERR, g_frames[0][0]);
}

TEST_F(InterfaceTest, SetParamSaveFailureKeepsOldConfig) {
  store.fail_save = true;
  Bytes body;
  tlv_u8(body, TAG_NODE_ADDR, 3);
  deliver(frame(Verb::SET_PARAM, 1, body));

  ASSERT_EQ(1u, g_frames.size());
  EXPECT_EQ(Verb::RESP_ERR, g_frames[0][0]);
  EXPECT_EQ(1, node_interface_stored_config().node_addr);
}

TEST_F(InterfaceTest, TruncatedTlvBlockIsRejected) {
  Bytes f = frame(Verb::GET_PARAM, 5);
  f[3] = 10;                          // claims 10 bytes, carries none
  deliver(f);

  ASSERT_EQ(1u, g_frames.size());
  EXPECT_EQ(Verb::RESP_ERR, g_frames[0][0]);
  EXPECT_EQ(5, g_frames[0][2]);
}

TEST_F(InterfaceTest, DanglingTlvInSetParamIsRejected) {
  Bytes body;
  tlv_u8(body, TAG_NODE_ADDR, 3);
  body.push_back(TAG_SF);            // tag with no length byte
  deliver(frame(Verb::SET_PARAM, 1, body));

  ASSERT_EQ(1u, g_frames.size());
  EXPECT_EQ(Verb::RESP_ERR, g_frames[0][0]);
  EXPECT_EQ(1, node_interface_stored_config().node_addr);
}

TEST_F(InterfaceTest, UnknownVerbIsRejected) {
  deliver(frame(0x7E, 8));
  ASSERT_EQ(1u, g_frames.size());
  EXPECT_EQ(Verb::RESP_ERR, g_frames[0][0]);
  EXPECT_EQ(8, g_frames[0][2]);
}

TEST_F(InterfaceTest, ShortFrameIsIgnored) {
  uint8_t b[2] = { Verb::PING, 0 };
  node_interface_on_packet(b, sizeof(b));
  node_interface_on_packet(nullptr, 0);
  EXPECT_TRUE(g_frames.empty());
}

TEST_F(InterfaceTest, GetAllReportsDiagnosticsFromContext) {
  FakeClock     clock(7500);
  FakeRadio     radio(clock);
  FakeDisplay   display;
  FakeIndicator led;
  NodeContext   ctx(radio, display, led, clock,
                    node_identity_from(node_interface_config()),
                    node_schedule_from(node_interface_config()));
  ctx.counter           = 12;
  ctx.stats.tx_count    = 13;
  ctx.stats.rx_count    = 4;
  ctx.stats.iterations  = 99;
  ctx.stats.last_rssi   = -42;
  node_interface_bind(&ctx);

  deliver(frame(Verb::GET_ALL, 2));

  ASSERT_EQ(1u, g_frames.size());
  const Bytes& r = g_frames[0];
  EXPECT_EQ(Verb::RESP_OK, r[0]);
  EXPECT_EQ(static_cast<size_t>(r[3]) + 4, r.size());
  EXPECT_EQ(13u, le32(find_tlv(r, TAG_TX_COUNT)));
  EXPECT_EQ(12u, le32(find_tlv(r, TAG_MSG_COUNTER)));
  EXPECT_EQ(4u, le32(find_tlv(r, TAG_RX_COUNT)));
  EXPECT_EQ(99u, le32(find_tlv(r, TAG_ITERATIONS)));
  EXPECT_EQ(7u, le32(find_tlv(r, TAG_UPTIME_S)));

  Bytes rssi = find_tlv(r, TAG_RSSI_DBM);
  ASSERT_EQ(2u, rssi.size());
  EXPECT_EQ(0xD6, rssi[0]);
  EXPECT_EQ(0xFF, rssi[1]);

  Bytes ver = find_tlv(r, TAG_FW_VERSION);
  EXPECT_FALSE(ver.empty());

  node_interface_bind(nullptr);
}

TEST_F(InterfaceTest, RxEventCarriesHeaderRssiAndPayload) {
  NodeInboundPacket pkt;
  pkt.header.dest = 1;
  pkt.header.src  = 2;
  pkt.rssi        = -42;
  const char* text = "hello";
  pkt.payload.assign(text, text + strlen(text));

  node_interface_report_rx(pkt);

  ASSERT_EQ(1u, g_frames.size());
  const Bytes& r = g_frames[0];
  EXPECT_EQ(Verb::RX_EVENT, r[0]);
  EXPECT_EQ(0, r[2]);
  EXPECT_EQ(Bytes(1, 2), find_tlv(r, TAG_SRC_ADDR));
  EXPECT_EQ(Bytes(1, 1), find_tlv(r, TAG_DEST_ADDR));
  EXPECT_EQ(pkt.payload, find_tlv(r, TAG_PAYLOAD));
  Bytes rssi = find_tlv(r, TAG_RSSI_DBM);
  ASSERT_EQ(2u, rssi.size());
  EXPECT_EQ(static_cast<int16_t>(-42), static_cast<int16_t>(rssi[0] | (rssi[1] << 8)));
}

TEST_F(InterfaceTest, RxEventClampsOversizePayload) {
  NodeInboundPacket pkt;
  pkt.payload.assign(251, 'x');

  node_interface_report_rx(pkt);

  ASSERT_EQ(1u, g_frames.size());
  const Bytes& r = g_frames[0];
  EXPECT_EQ(255, r[3]);
  EXPECT_EQ(259u, r.size());
  EXPECT_EQ(243u, find_tlv(r, TAG_PAYLOAD).size());
}

TEST_F(InterfaceTest, TxEventCarriesCounterAndPayload) {
  const char* text = "msg num 3 node 1";
  NodePayload p(text, text + strlen(text));

  node_interface_report_tx(3, p);

  ASSERT_EQ(1u, g_frames.size());
  EXPECT_EQ(Verb::TX_EVENT, g_frames[0][0]);
  EXPECT_EQ(3u, le32(find_tlv(g_frames[0], TAG_MSG_COUNTER)));
  EXPECT_EQ(p, find_tlv(g_frames[0], TAG_PAYLOAD));
}

TEST_F(InterfaceTest, NoSenderDropsFrames) {
  node_interface_set_sender(nullptr);
  deliver(frame(Verb::PING, 1));
  EXPECT_TRUE(g_frames.empty());
}

TEST_F(InterfaceTest, IdentityReportsRunningAddressAfterSetParam) {
  FakeClock     clock;
  FakeRadio     radio(clock);
  FakeDisplay   display;
  FakeIndicator led;
  NodeContext   ctx(radio, display, led, clock,
                    node_identity_from(node_interface_config()),
                    node_schedule_from(node_interface_config()));
  node_interface_bind(&ctx);

  Bytes body;
  tlv_u8(body, TAG_NODE_ADDR, 5);
  tlv_u32(body, TAG_TX_INTERVAL_MS, 4000);
  deliver(frame(Verb::SET_PARAM, 1, body));
  ASSERT_EQ(1u, g_frames.size());
  EXPECT_EQ(Verb::RESP_OK, g_frames[0][0]);
  EXPECT_EQ(Bytes(1, 5), find_tlv(g_frames[0], TAG_NODE_ADDR));   // pending value

  deliver(frame(Verb::PING, 2));
  ASSERT_EQ(2u, g_frames.size());
  EXPECT_EQ(ctx.identity.local, g_frames[1][6]);

  deliver(frame(Verb::GET_ID, 3));
  EXPECT_EQ(ctx.identity.local, g_frames.back()[6]);

  deliver(frame(Verb::GET_ALL, 4));
  const Bytes& all = g_frames.back();
  EXPECT_EQ(Bytes(1, ctx.identity.local), find_tlv(all, TAG_NODE_ADDR));
  EXPECT_EQ(ctx.schedule.tx_interval_ms, le32(find_tlv(all, TAG_TX_INTERVAL_MS)));

  node_interface_send_hello();
  EXPECT_EQ(ctx.identity.local, g_frames.back()[6]);

  node_interface_bind(nullptr);
}

TEST_F(InterfaceTest, UnboundReadsUseBootConfigNotPendingWrite) {
  Bytes body;
  tlv_u8(body, TAG_SF, 9);
  deliver(frame(Verb::SET_PARAM, 1, body));

  Bytes req;
  req.push_back(TAG_SF); req.push_back(0);
  deliver(frame(Verb::GET_PARAM, 2, req));

  ASSERT_EQ(2u, g_frames.size());
  EXPECT_EQ(Bytes(1, 7), find_tlv(g_frames[1], TAG_SF));
  EXPECT_EQ(9, node_interface_stored_config().sf);
}

TEST_F(InterfaceTest, BoundContextIdentityWinsOverBootConfig) {
  FakeClock     clock;
  FakeRadio     radio(clock);
  FakeDisplay   display;
  FakeIndicator led;
  NodeIdentity  id;
  id.local = 9;
  id.dest  = NODE_BROADCAST_ADDR;
  NodeContext   ctx(radio, display, led, clock, id, NodeSchedule());
  node_interface_bind(&ctx);

  Bytes req;
  req.push_back(TAG_NODE_ADDR); req.push_back(0);
  req.push_back(TAG_DEST_ADDR); req.push_back(0);
  deliver(frame(Verb::GET_PARAM, 6, req));

  ASSERT_EQ(1u, g_frames.size());
  EXPECT_EQ(Bytes(1, 9), find_tlv(g_frames[0], TAG_NODE_ADDR));
  EXPECT_EQ(Bytes(1, 0xFF), find_tlv(g_frames[0], TAG_DEST_ADDR));

  node_interface_bind(nullptr);
}

TEST_F(InterfaceTest, TextGoesOutAsMsgFrame) {
  node_interface_send_text("[TX] to 2: msg num 1 node 1");

  ASSERT_EQ(1u, g_frames.size());
  const Bytes& r = g_frames[0];
  EXPECT_EQ(Verb::MSG, r[0]);
  EXPECT_EQ(0, r[2]);
  std::string text(r.begin() + 4, r.end());
  EXPECT_EQ("[TX] to 2: msg num 1 node 1", text);
  EXPECT_EQ(text.size(), static_cast<size_t>(r[3]));
}

TEST_F(InterfaceTest, OverlongTextIsCutWithMarker) {
  std::string big(300, 'z');
  node_interface_send_text(big.c_str());

  ASSERT_EQ(1u, g_frames.size());
  const Bytes& r = g_frames[0];
  EXPECT_EQ(255, r[3]);
  EXPECT_EQ(259u, r.size());
  std::string text(r.begin() + 4, r.end());
  EXPECT_EQ(std::string(252, 'z') + "...", text);
}

TEST_F(InterfaceTest, ExactlyMaxTextIsNotMarked) {
  std::string full(255, 'q');
  node_interface_send_text(full.c_str());
  ASSERT_EQ(1u, g_frames.size());
  EXPECT_EQ(full, std::string(g_frames[0].begin() + 4, g_frames[0].end()));

  node_interface_send_text(nullptr);
  EXPECT_EQ(1u, g_frames.size());
}
