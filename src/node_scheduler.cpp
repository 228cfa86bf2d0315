/**
 * @file node_scheduler.cpp
 * @brief Implementation for node_scheduler.hpp.
 *
 * Notes:
 * - Contract and guarantees live in the header. This file is the "how".
 * - Nothing here knows about Arduino. Keep it that way so the host tests
 *   exercise the exact code that runs on the board.
 */

#include "node_scheduler.hpp"
#include "node_message.hpp"     // payload wording, header split, text rendering
#include "node_log.hpp"         // [TX]/[RX] trace lines

#include <string>

NodeIdentity node_identity_from(const NodeConfig& cfg) {
  NodeIdentity id;
  id.local = cfg.node_addr;
  id.dest  = cfg.dest_addr;
  return id;
}

NodeSchedule node_schedule_from(const NodeConfig& cfg) {
  NodeSchedule s;
  s.tx_interval_ms = cfg.tx_interval_ms;
  s.dwell_ms       = cfg.dwell_ms;
  s.rx_timeout_ms  = cfg.rx_timeout_ms;
  return s;
}

// Send one payload and account for it. Shared by startup and periodic sends.
static void transmit(NodeContext& ctx, uint8_t dest, const NodePayload& payload,
                     bool keep_listening) {
  ctx.radio.send(dest, payload, keep_listening);
  ++ctx.stats.tx_count;
  // Outbound payloads are our own ASCII wording; log them as plain text.
  std::string text(payload.begin(), payload.end());
  node_log("TX", "to %u: %s", static_cast<unsigned>(dest), text.c_str());
  if (ctx.on_transmit) ctx.on_transmit(ctx.counter, payload);
}

/*------------------------------------------------------------------------------
  node_scheduler_start
  --------------------
  Liveness announcement. The counter is 0 here and the startup message
  carries that 0; the first periodic message will carry 1.

  The startup send does not ask the radio to keep listening. The first
  receive call switches it back.
------------------------------------------------------------------------------*/
void node_scheduler_start(NodeContext& ctx) {
  ctx.counter = 0;
  transmit(ctx, NODE_BROADCAST_ADDR,
           node_message_startup(ctx.counter, ctx.identity.local),
           /*keep_listening=*/false);
  ctx.last_tx_ms = ctx.clock.now_ms();
  ctx.indicator.set(true);
  node_log("BOOT", "node %u -> %u, every %lu ms",
           static_cast<unsigned>(ctx.identity.local),
           static_cast<unsigned>(ctx.identity.dest),
           static_cast<unsigned long>(ctx.schedule.tx_interval_ms));
}

/*------------------------------------------------------------------------------
  handle_packet
  -------------
  Render one received packet and hold it on screen for the dwell period.

  Phases:
  1) Trace the raw header, payload and RSSI.
  2) Append payload line, then RSSI line (payload above RSSI).
  3) Push + flush, indicator on.
  4) Notify the observer, then block for the dwell.

  The header is not checked against our address; whatever the radio hands
  up is shown.
------------------------------------------------------------------------------*/
static void handle_packet(NodeContext& ctx, const NodeInboundPacket& pkt) {
  std::string text = node_message_payload_text(pkt.payload);
  node_log("RX", "hdr %s payload %s rssi %d",
           node_message_header_hex(pkt.header).c_str(), text.c_str(),
           static_cast<int>(pkt.rssi));

  NodeTextLine payload_line;
  payload_line.x    = 0;
  payload_line.y    = NODE_PAYLOAD_LINE_Y;
  payload_line.text = text;
  ctx.frame.lines.push_back(payload_line);

  NodeTextLine rssi_line;
  rssi_line.x    = 0;
  rssi_line.y    = NODE_RSSI_LINE_Y;
  rssi_line.text = node_message_rssi_text(pkt.rssi);
  ctx.frame.lines.push_back(rssi_line);

  ctx.display.show(ctx.frame);
  ctx.display.refresh();
  ctx.indicator.set(true);

  ++ctx.stats.rx_count;
  ctx.stats.last_rssi = pkt.rssi;
  if (ctx.on_receive) ctx.on_receive(pkt);

  ctx.clock.sleep_ms(ctx.schedule.dwell_ms);
}

/*------------------------------------------------------------------------------
  node_scheduler_step
  -------------------
  Ordering is fixed: frame reset, then receive, then transmit check. The
  transmit check reads the clock after the receive and the dwell, so a due
  transmit is late by at most one of each and is never skipped.
------------------------------------------------------------------------------*/
void node_scheduler_step(NodeContext& ctx) {
  ++ctx.stats.iterations;

  // 1) Fresh frame, background only.
  ctx.frame = NodeFrame();
  ++ctx.stats.frames_built;
  ctx.display.show(ctx.frame);
  ctx.display.refresh();

  // 2) Listening.
  ctx.indicator.set(false);

  // 3) Poll for at most one packet.
  NodePayload raw;
  if (ctx.radio.receive(/*with_header=*/true, ctx.schedule.rx_timeout_ms, raw)) {
    NodeInboundPacket pkt;
    node_message_split(raw, pkt);
    pkt.rssi = ctx.radio.last_rssi();
    handle_packet(ctx, pkt);
  }

  // 4) Periodic transmit. Unsigned subtraction handles clock wrap.
  uint32_t now = ctx.clock.now_ms();
  if (static_cast<uint32_t>(now - ctx.last_tx_ms) >= ctx.schedule.tx_interval_ms) {
    ctx.last_tx_ms = now;
    ++ctx.counter;
    transmit(ctx, ctx.identity.dest,
             node_message_periodic(ctx.counter, ctx.identity.local),
             /*keep_listening=*/true);
  }
}

void node_scheduler_run(NodeContext& ctx, const NodeStopToken& stop) {
  while (!stop.stop_requested()) {
    node_scheduler_step(ctx);
  }
}
