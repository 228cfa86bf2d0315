#pragma once
/**
 * @page pn-node-scheduler PingNode Scheduler Loop
 * @file node_scheduler.hpp
 * @brief Half-duplex send/receive scheduler for one addressed LoRa node.
 *
 * Overview
 * --------
 * This is the part of the node with actual behavior. One cooperative,
 * single-threaded loop interleaves a timeout-bounded receive poll with a
 * time-gated periodic transmit, and forwards what it sees to a display and
 * an indicator light. No threads, no queues, no retries.
 *
 * Where This Fits
 * ---------------
 * - Below: node_hal.hpp capabilities (radio, display, indicator, clock).
 * - Beside: node_interface.* reads NodeContext stats for diagnostics and
 *   receives RX/TX events through the observer hooks.
 * - Above: main.cpp calls node_scheduler_start() once from setup() and
 *   node_scheduler_step() once per loop(). Hosts and tests can use
 *   node_scheduler_run() with a stop token instead.
 *
 * One Iteration
 * -------------
 * 1) Build a fresh, empty frame (background only) and push it. Always, even
 *    if nothing arrives; prior frame content never persists.
 * 2) Indicator off ("listening").
 * 3) receive(with_header=true, rx_timeout). On a packet: split header and
 *    payload, add the payload line at y=10 and "RSSI: n" at y=25, push the
 *    frame, indicator on, then block for the dwell period.
 * 4) If now - last_tx >= tx_interval: last_tx = now, ++counter, send
 *    "msg num <counter> node <local>" to the destination, keep listening.
 *
 * Startup sends "Startup message 0 from node <local>" to the broadcast
 * address and starts the transmit timer.
 *
 * Guarantees
 * ----------
 * - Exactly one frame is built per iteration.
 * - At most one packet is handled and at most one transmit happens per
 *   iteration. A receive never cancels a due transmit; it can only delay it
 *   by one dwell plus one receive timeout.
 * - The counter goes up by exactly 1 per periodic transmit, wrapping at
 *   2^32. Elapsed time is computed with unsigned subtraction, so clock
 *   wrap-around does not stall or double-fire the transmit.
 * - Received packets are not filtered by destination address. Every packet
 *   the radio hands up is rendered.
 *
 * Failure Model
 * -------------
 * "Nothing received" is a normal outcome. Hardware faults are the adapters'
 * problem; the loop never sees an error value and never gives up.
 *
 * Typical Usage (host)
 * --------------------
 * @code
 * NodeContext ctx(radio, display, led, clock,
 *                 node_identity_from(cfg), node_schedule_from(cfg));
 * NodeStopToken stop;
 * node_scheduler_start(ctx);
 * node_scheduler_run(ctx, stop);   // returns once stop.request_stop() is seen
 * @endcode
 *
 * @author Leo
 */

#include "node_hal.hpp"
#include "node_config.hpp"

#include <atomic>
#include <cstdint>

/** Vertical pixel positions of the two lines drawn for a received packet. */
static constexpr int16_t NODE_PAYLOAD_LINE_Y = 10;
static constexpr int16_t NODE_RSSI_LINE_Y    = 25;

/** Who we are and who we talk to. Fixed for the life of the loop. */
struct NodeIdentity {
  uint8_t local = 1;
  uint8_t dest  = 2;
};

/** Scheduler timings in milliseconds. */
struct NodeSchedule {
  uint32_t tx_interval_ms = 1000;
  uint32_t dwell_ms       = 500;
  uint32_t rx_timeout_ms  = 500;
};

/** Running counts, readable by diagnostics. */
struct NodeStats {
  uint32_t iterations   = 0;
  uint32_t frames_built = 0;
  uint32_t rx_count     = 0;
  uint32_t tx_count     = 0;   // every transmission, startup included
  int16_t  last_rssi    = 0;
};

typedef void (*node_rx_hook_t)(const NodeInboundPacket& packet);
typedef void (*node_tx_hook_t)(uint32_t counter, const NodePayload& payload);

/**
 * @brief Everything the loop owns, in one place.
 *
 * Holds references to the hardware capabilities; the caller keeps those
 * objects alive for as long as the context is used.
 */
struct NodeContext {
  NodeContext(NodeRadio& r, NodeDisplay& d, NodeIndicator& i, NodeClock& c,
              const NodeIdentity& id, const NodeSchedule& sched)
      : radio(r), display(d), indicator(i), clock(c),
        identity(id), schedule(sched) {}

  NodeRadio&         radio;
  NodeDisplay&       display;
  NodeIndicator&     indicator;
  NodeClock&         clock;

  const NodeIdentity identity;
  const NodeSchedule schedule;

  uint32_t  counter    = 0;    // message counter
  uint32_t  last_tx_ms = 0;    // transmit timer
  NodeFrame frame;             // frame built by the latest iteration
  NodeStats stats;

  // Optional observers; null means nobody is listening.
  node_rx_hook_t on_receive  = nullptr;
  node_tx_hook_t on_transmit = nullptr;
};

/** Stop flag for node_scheduler_run(). */
class NodeStopToken {
public:
  NodeStopToken() : stop_(false) {}
  void request_stop() { stop_.store(true); }
  bool stop_requested() const { return stop_.load(); }

private:
  std::atomic<bool> stop_;
};

/** Identity pair taken from configuration. */
NodeIdentity node_identity_from(const NodeConfig& cfg);

/** Scheduler timings taken from configuration. */
NodeSchedule node_schedule_from(const NodeConfig& cfg);

/**
 * @brief One-time startup: reset the counter, broadcast the startup
 * message, start the transmit timer, light the indicator.
 */
void node_scheduler_start(NodeContext& ctx);

/** @brief Run exactly one iteration (see "One Iteration" above). */
void node_scheduler_step(NodeContext& ctx);

/**
 * @brief Repeat node_scheduler_step() until @p stop is raised.
 *
 * The token is checked before every iteration, so an iteration in progress
 * always completes.
 */
void node_scheduler_run(NodeContext& ctx, const NodeStopToken& stop);
