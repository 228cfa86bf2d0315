// node_interface.cpp - implementation for node_interface.hpp
// See node_interface.hpp for the verb contract and tests/test_node_interface.cpp
// for worked frames.

#include "node_interface.hpp"   // host-facing API
#include "node_protocol.hpp"    // Verb / Tag enums (no transport calls from here)
#include "node_scheduler.hpp"   // NodeContext for diagnostics
#include "node_log.hpp"         // [CFG] trace lines

#include <cstring>              // memcpy, strlen
#include <type_traits>          // std::make_unsigned

#ifndef PINGNODE_FW_VERSION
#define PINGNODE_FW_VERSION "0.1.0"
#endif

// ============================================================================
// State
// ============================================================================

static NodeConfig          s_active;              // config the node booted with (running)
static NodeConfig          s_stored;              // config persisted for the next boot
static NodeConfigStore*    s_store  = nullptr;    // persistence for SET_PARAM
static NodeContext*        s_ctx    = nullptr;    // running scheduler (identity, diagnostics)
static node_frame_sender_t s_sender = nullptr;    // outbound frame writer

static void send_frame(const uint8_t* b, size_t n) {
  if (s_sender) s_sender(b, n);
}


// ============================================================================
// Frame / TLV helpers
// ============================================================================

//
// frame_begin()
// -------------
// Reset the cursor and write the 4-byte header [verb][flags=0][seq][len=0].
// frame_end() patches the length once all TLVs are in.
//
static inline void frame_begin(uint8_t verb, uint8_t seq, uint8_t* buf, size_t& i) {
  i = 0;
  buf[i++] = verb;
  buf[i++] = 0;
  buf[i++] = seq;
  buf[i++] = 0;
}

static inline void frame_end(uint8_t* buf, size_t& i) {
  buf[3] = static_cast<uint8_t>(i - 4);
}

// Append tag, len, value. Caller guarantees headroom.
static inline void tlv_put(uint8_t* buf, size_t& i, uint8_t tag, const void* p, uint8_t len) {
  buf[i++] = tag;
  buf[i++] = len;
  if (len) { memcpy(buf + i, p, len); i += len; }
}

// Integral value as little-endian TLV. Signed values go out as their
// two's-complement bytes.
template<typename T>
static inline void tlv_put_le(uint8_t* buf, size_t& i, uint8_t tag, T value) {
  typedef typename std::make_unsigned<T>::type U;
  U u = static_cast<U>(value);
  uint8_t tmp[sizeof(T)];
  for (size_t j = 0; j < sizeof(T); ++j)
    tmp[j] = static_cast<uint8_t>((u >> (8 * j)) & 0xFF);
  tlv_put(buf, i, tag, tmp, sizeof(T));
}

// Little-endian decode; rejects any width mismatch. Bytes are assembled in
// the unsigned type, then converted.
template<typename T>
static bool tlv_read_le(const uint8_t* p, uint8_t len, T& out) {
  if (len != sizeof(T)) return false;
  typedef typename std::make_unsigned<T>::type U;
  uint32_t acc = 0;
  for (size_t j = 0; j < sizeof(T); ++j) {
    acc |= static_cast<uint32_t>(p[j]) << (8 * j);
  }
  out = static_cast<T>(static_cast<U>(acc));
  return true;
}

// TLV block must fit inside what the transport delivered.
static bool tlv_block_ok(const uint8_t* frame, size_t len) {
  return len >= 4 && 4 + static_cast<size_t>(frame[3]) <= len;
}

static void send_resp_err(uint8_t seq) {
  uint8_t b[8]; size_t i;
  frame_begin(Verb::RESP_ERR, seq, b, i);
  frame_end(b, i);
  send_frame(b, i);
}


// ============================================================================
// Tag serialization
// ============================================================================

//
// live_config()
// -------------
// What the node is actually running. Radio settings come from the boot
// config. Identity and timings come from the bound scheduler context when
// there is one, since that is what the loop uses on air.
//
static NodeConfig live_config() {
  NodeConfig c = s_active;
  if (s_ctx) {
    c.node_addr      = s_ctx->identity.local;
    c.dest_addr      = s_ctx->identity.dest;
    c.tx_interval_ms = s_ctx->schedule.tx_interval_ms;
    c.dwell_ms       = s_ctx->schedule.dwell_ms;
    c.rx_timeout_ms  = s_ctx->schedule.rx_timeout_ms;
  }
  return c;
}

//
// put_tag_value()
// ---------------
// Append one TLV for `tag`. Settings are read from `c` (live or stored,
// caller's choice); system and diagnostic tags always describe the running
// node. Unknown tags append nothing.
//
static void put_tag_value(uint8_t* buf, size_t& i, uint8_t tag, const NodeConfig& c) {
  switch (tag) {
    // identity
    case TAG_NODE_ADDR:      tlv_put_le<uint8_t>(buf, i, tag, c.node_addr); break;
    case TAG_DEST_ADDR:      tlv_put_le<uint8_t>(buf, i, tag, c.dest_addr); break;

    // system
    case TAG_FW_VERSION: {
      const char* ver = PINGNODE_FW_VERSION;
      tlv_put(buf, i, tag, ver, static_cast<uint8_t>(strlen(ver)));
      break;
    }
    case TAG_UPTIME_S: {
      uint32_t up = s_ctx ? s_ctx->clock.now_ms() / 1000 : 0;
      tlv_put_le<uint32_t>(buf, i, tag, up);
      break;
    }

    // radio
    case TAG_FREQ_HZ:        tlv_put_le<uint32_t>(buf, i, tag, c.freq_hz); break;
    case TAG_SF:             tlv_put_le<uint8_t>(buf, i, tag, c.sf); break;
    case TAG_BW_HZ:          tlv_put_le<uint32_t>(buf, i, tag, c.bw_hz); break;
    case TAG_CR:             tlv_put_le<uint8_t>(buf, i, tag, c.cr); break;
    case TAG_TX_PWR_DBM:     tlv_put_le<int8_t>(buf, i, tag, c.tx_pwr_dbm); break;

    // schedule
    case TAG_TX_INTERVAL_MS: tlv_put_le<uint32_t>(buf, i, tag, c.tx_interval_ms); break;
    case TAG_DWELL_MS:       tlv_put_le<uint32_t>(buf, i, tag, c.dwell_ms); break;
    case TAG_RX_TIMEOUT_MS:  tlv_put_le<uint32_t>(buf, i, tag, c.rx_timeout_ms); break;

    // diagnostics (zero when no context is bound)
    case TAG_RSSI_DBM:    tlv_put_le<int16_t>(buf, i, tag, s_ctx ? s_ctx->stats.last_rssi : 0); break;
    case TAG_TX_COUNT:    tlv_put_le<uint32_t>(buf, i, tag, s_ctx ? s_ctx->stats.tx_count : 0); break;
    case TAG_RX_COUNT:    tlv_put_le<uint32_t>(buf, i, tag, s_ctx ? s_ctx->stats.rx_count : 0); break;
    case TAG_ITERATIONS:  tlv_put_le<uint32_t>(buf, i, tag, s_ctx ? s_ctx->stats.iterations : 0); break;
    case TAG_MSG_COUNTER: tlv_put_le<uint32_t>(buf, i, tag, s_ctx ? s_ctx->counter : 0); break;

    default:
      break;
  }
}

// Every tag SET_PARAM accepts, in echo order.
static const uint8_t kSettableTags[] = {
  TAG_NODE_ADDR, TAG_DEST_ADDR,
  TAG_FREQ_HZ, TAG_SF, TAG_BW_HZ, TAG_CR, TAG_TX_PWR_DBM,
  TAG_TX_INTERVAL_MS, TAG_DWELL_MS, TAG_RX_TIMEOUT_MS
};

static const uint8_t kAllTags[] = {
  TAG_NODE_ADDR, TAG_DEST_ADDR, TAG_FW_VERSION, TAG_UPTIME_S,
  TAG_FREQ_HZ, TAG_SF, TAG_BW_HZ, TAG_CR, TAG_TX_PWR_DBM,
  TAG_TX_INTERVAL_MS, TAG_DWELL_MS, TAG_RX_TIMEOUT_MS,
  TAG_RSSI_DBM, TAG_TX_COUNT, TAG_RX_COUNT, TAG_ITERATIONS, TAG_MSG_COUNTER
};


// ============================================================================
// SET_PARAM staging
// ============================================================================

//
// stage_tag()
// -----------
// Decode one TLV into the staged copy with its per-field range check.
// Cross-field rules (dwell < interval) are checked afterwards on the whole
// copy. Unknown and read-only tags are skipped.
//
static bool stage_tag(NodeConfig& c, uint8_t tag, const uint8_t* p, uint8_t L) {
  switch (tag) {
    case TAG_NODE_ADDR: {
      uint8_t v;
      if (!tlv_read_le<uint8_t>(p, L, v) || !node_config_valid_node_addr(v)) return false;
      c.node_addr = v;
      return true;
    }
    case TAG_DEST_ADDR: {
      uint8_t v;
      if (!tlv_read_le<uint8_t>(p, L, v) || !node_config_valid_dest_addr(v)) return false;
      c.dest_addr = v;
      return true;
    }
    case TAG_FREQ_HZ: {
      uint32_t v;
      if (!tlv_read_le<uint32_t>(p, L, v) || !node_config_valid_freq(v)) return false;
      c.freq_hz = v;
      return true;
    }
    case TAG_SF: {
      uint8_t v;
      if (!tlv_read_le<uint8_t>(p, L, v) || !node_config_valid_sf(v)) return false;
      c.sf = v;
      return true;
    }
    case TAG_BW_HZ: {
      uint32_t v;
      if (!tlv_read_le<uint32_t>(p, L, v) || !node_config_valid_bw(v)) return false;
      c.bw_hz = v;
      return true;
    }
    case TAG_CR: {
      uint8_t v;
      if (!tlv_read_le<uint8_t>(p, L, v) || !node_config_valid_cr(v)) return false;
      c.cr = v;
      return true;
    }
    case TAG_TX_PWR_DBM: {
      int8_t v;
      if (!tlv_read_le<int8_t>(p, L, v) || !node_config_valid_tx_pwr(v)) return false;
      c.tx_pwr_dbm = v;
      return true;
    }
    case TAG_TX_INTERVAL_MS: {
      uint32_t v;
      if (!tlv_read_le<uint32_t>(p, L, v) || !node_config_valid_tx_interval(v)) return false;
      c.tx_interval_ms = v;
      return true;
    }
    case TAG_DWELL_MS:
      return tlv_read_le<uint32_t>(p, L, c.dwell_ms);
    case TAG_RX_TIMEOUT_MS: {
      uint32_t v;
      if (!tlv_read_le<uint32_t>(p, L, v) || !node_config_valid_rx_timeout(v)) return false;
      c.rx_timeout_ms = v;
      return true;
    }
    default:
      return true;
  }
}

//
// handle_set_param()
// ------------------
// Phases:
//   1) Stage every TLV into a copy of the stored config (per-field checks).
//   2) Validate the whole copy (cross-field rules).
//   3) Persist. Only a successful save replaces s_stored.
//   4) Echo the stored settings. The running node is untouched until reboot.
//
static void handle_set_param(const uint8_t* frame, uint8_t seq) {
  // 1) stage
  NodeConfig staged = s_stored;
  bool ok = true;

  size_t off = 4, end = 4 + frame[3];
  while (ok && off < end) {
    if (off + 2 > end) { ok = false; break; }         // dangling tag byte
    uint8_t t = frame[off++];
    uint8_t L = frame[off++];
    if (off + L > end) { ok = false; break; }         // value runs past block
    ok = stage_tag(staged, t, frame + off, L);
    off += L;
  }

  // 2) whole-config validation
  if (ok) {
    NodeConfigError err = node_config_validate(staged);
    if (err != NODE_CONFIG_OK) {
      node_log("CFG", "rejected: %s", node_config_error_name(err));
      ok = false;
    }
  }
  // 3) persist
  if (ok && (!s_store || !s_store->save(staged))) {
    node_log("CFG", "save failed");
    ok = false;
  }
  if (!ok) { send_resp_err(seq); return; }

  s_stored = staged;
  node_log("CFG", "saved, applies at next boot");

  // 4) echo what will be used at next boot
  uint8_t b[96]; size_t i;
  frame_begin(Verb::RESP_OK, seq, b, i);
  for (size_t k = 0; k < sizeof(kSettableTags); ++k) {
    put_tag_value(b, i, kSettableTags[k], s_stored);
  }
  frame_end(b, i);
  send_frame(b, i);
}


// ============================================================================
// Public API
// ============================================================================

void node_interface_begin(NodeConfigStore& store) {
  s_store  = &store;
  s_ctx    = nullptr;
  s_active = node_config_load(store);
  s_stored = s_active;
}

const NodeConfig& node_interface_config() { return s_active; }

const NodeConfig& node_interface_stored_config() { return s_stored; }

void node_interface_bind(NodeContext* ctx) { s_ctx = ctx; }

void node_interface_set_sender(node_frame_sender_t sender) { s_sender = sender; }

void node_interface_send_hello() {
  uint8_t b[16]; size_t i;
  frame_begin(Verb::RESP_OK, 0, b, i);
  put_tag_value(b, i, TAG_NODE_ADDR, live_config());
  frame_end(b, i);
  send_frame(b, i);
}

//
// node_interface_report_rx()
// --------------------------
// [RX_EVENT][0][0][len] SRC DEST RSSI PAYLOAD
// The fixed TLVs take 12 bytes of the 255-byte block; the payload gets the
// rest and is clamped if the radio handed up more.
//
void node_interface_report_rx(const NodeInboundPacket& packet) {
  static const size_t kFixed = 3 + 3 + 4 + 2;
  size_t n = packet.payload.size();
  if (n > 255 - kFixed) n = 255 - kFixed;

  uint8_t b[4 + 255]; size_t i;
  frame_begin(Verb::RX_EVENT, 0, b, i);
  tlv_put_le<uint8_t>(b, i, TAG_SRC_ADDR, packet.header.src);
  tlv_put_le<uint8_t>(b, i, TAG_DEST_ADDR, packet.header.dest);
  tlv_put_le<int16_t>(b, i, TAG_RSSI_DBM, packet.rssi);
  tlv_put(b, i, TAG_PAYLOAD, n ? &packet.payload[0] : nullptr, static_cast<uint8_t>(n));
  frame_end(b, i);
  send_frame(b, i);
}

// [TX_EVENT][0][0][len] MSG_COUNTER PAYLOAD, payload clamped like RX_EVENT.
void node_interface_report_tx(uint32_t counter, const NodePayload& payload) {
  static const size_t kFixed = 6 + 2;
  size_t n = payload.size();
  if (n > 255 - kFixed) n = 255 - kFixed;

  uint8_t b[4 + 255]; size_t i;
  frame_begin(Verb::TX_EVENT, 0, b, i);
  tlv_put_le<uint32_t>(b, i, TAG_MSG_COUNTER, counter);
  tlv_put(b, i, TAG_PAYLOAD, n ? &payload[0] : nullptr, static_cast<uint8_t>(n));
  frame_end(b, i);
  send_frame(b, i);
}

//
// node_interface_send_text()
// --------------------------
// [MSG][0][0][n] + raw text. The text is not a TLV; n is its length, so one
// frame carries at most 255 bytes. Longer text is cut and its last three
// bytes become "..." so the host can tell the line was shortened.
//
void node_interface_send_text(const char* text) {
  static const size_t kMaxText = 255;
  if (!text) return;

  // 1) measure without reading past kMaxText + 1
  size_t n = 0;
  while (n <= kMaxText && text[n]) ++n;
  const bool cut = n > kMaxText;
  if (cut) n = kMaxText;

  // 2) header + body
  uint8_t b[4 + kMaxText]; size_t i;
  frame_begin(Verb::MSG, 0, b, i);
  memcpy(b + i, text, n);
  i += n;
  if (cut) memcpy(b + i - 3, "...", 3);

  // 3) length byte covers the text
  frame_end(b, i);
  send_frame(b, i);
}

//
// node_interface_on_packet()
// --------------------------
// Verb dispatcher for one complete frame.
//
// Flow:
//   1) Drop anything too short to carry a header (nothing to answer).
//   2) A TLV block that claims more bytes than arrived -> RESP_ERR.
//   3) switch(verb) -> RESP_OK with tags, or RESP_ERR for unknown verbs.
//
void node_interface_on_packet(const uint8_t* frame, size_t len) {
  // 1) header guard
  if (!frame || len < 4) return;

  const uint8_t verb = frame[0];
  const uint8_t seq  = frame[2];

  // 2) bounds guard
  if (!tlv_block_ok(frame, len)) { send_resp_err(seq); return; }

  // 3) dispatch

  switch (verb) {

    // Identity is what the radio is using right now, not a pending write.
    case Verb::GET_ID:
    case Verb::PING: {
      uint8_t b[16]; size_t i;
      frame_begin(Verb::RESP_OK, seq, b, i);
      put_tag_value(b, i, TAG_NODE_ADDR, live_config());
      frame_end(b, i);
      send_frame(b, i);
      break;
    }

    // Tag-only TLVs (len 0) are requests; anything with a value is skipped.
    case Verb::GET_PARAM: {
      uint8_t b[192]; size_t i;
      frame_begin(Verb::RESP_OK, seq, b, i);
      const NodeConfig live = live_config();
      size_t off = 4, end = 4 + frame[3];
      while (off + 2 <= end && i + 40 <= sizeof(b)) {   // room for the widest TLV
        uint8_t t = frame[off++];
        uint8_t L = frame[off++];
        off += L;
        if (L == 0) put_tag_value(b, i, t, live);
      }
      frame_end(b, i);
      send_frame(b, i);
      break;
    }

    case Verb::SET_PARAM:
      handle_set_param(frame, seq);
      break;

    // Running settings plus diagnostics.
    case Verb::GET_ALL: {
      uint8_t b[192]; size_t i;
      frame_begin(Verb::RESP_OK, seq, b, i);
      const NodeConfig live = live_config();
      for (size_t k = 0; k < sizeof(kAllTags); ++k) put_tag_value(b, i, kAllTags[k], live);
      frame_end(b, i);
      send_frame(b, i);
      break;
    }

    default:
      send_resp_err(seq);
      break;
  }
}
