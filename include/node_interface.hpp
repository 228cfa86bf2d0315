#pragma once
/**
 * @page pn-node-interface PingNode Host Interface (Config + Diagnostics + Events)
 * @file node_interface.hpp
 * @brief Host-facing node brain: configuration, verb dispatch, TLV I/O, event frames.
 *
 * Overview
 * --------
 * This module sits between the host link transport (node_protocol) and the
 * rest of the node. It holds two configurations: the one the node booted
 * with (running) and the one persisted for the next boot (stored). It
 * interprets inbound frames (verbs + TLVs), writes validated configuration
 * back through a NodeConfigStore, and reports radio activity and trace text
 * to the host as unsolicited frames.
 *
 * It never touches the radio or the display. The scheduler is read through
 * a bound NodeContext pointer (diagnostics only) and feeds RX/TX events in
 * through node_interface_report_rx() / node_interface_report_tx(), whose
 * signatures match the NodeContext observer hooks.
 *
 * Outbound frames go through one installable sender. The firmware installs
 * protocol_send(); tests install a capture function. With no sender, frames
 * are dropped.
 *
 * Supported Verbs (see @ref node_protocol.hpp)
 * --------------------------------------------
 * - GET_ID / PING: RESP_OK with TAG_NODE_ADDR.
 * - GET_PARAM: tags sent with len=0 come back populated. Unknown tags are
 *   skipped.
 *
 * Reads report what the node is running: identity and timings from the
 * bound NodeContext (boot config when none is bound), radio settings from
 * the boot config. A SET_PARAM never changes these answers before reboot.
 * - SET_PARAM: every TLV is parsed and range-checked into a staged copy,
 *   then the whole copy is validated (dwell must stay below the interval)
 *   and saved. Any failure returns RESP_ERR and changes nothing. On success
 *   RESP_OK echoes every settable tag from the stored config. That echo is
 *   the only place pending values are reported. New values apply at next
 *   boot; the running loop keeps the identity and timings it started with.
 * - GET_ALL: identity, radio, schedule and diagnostic tags.
 * - Anything else, or a frame whose TLV block overruns its length:
 *   RESP_ERR.
 *
 * Events
 * ------
 * - RX_EVENT: TAG_SRC_ADDR, TAG_DEST_ADDR (header fields), TAG_RSSI_DBM,
 *   TAG_PAYLOAD (clamped to fit one frame).
 * - TX_EVENT: TAG_MSG_COUNTER (message counter), TAG_PAYLOAD.
 * - MSG: raw trace text (see node_interface_send_text()).
 *
 * Counters
 * --------
 * - TAG_TX_COUNT: every transmission, startup broadcast included.
 * - TAG_MSG_COUNTER: the message counter carried in the payload wording
 *   (0 at startup, +1 per periodic send).
 *
 * Testing Hooks
 * -------------
 * - node_interface_config() / node_interface_stored_config() expose the
 *   running and stored configs.
 * - node_interface_set_sender() captures every outbound frame.
 *
 * @author Leo
 */

#include "node_config.hpp"
#include "node_hal.hpp"

#include <cstddef>
#include <cstdint>

struct NodeContext;

/** Outbound frame writer. */
typedef void (*node_frame_sender_t)(const uint8_t* frame, size_t len);

/**
 * @brief Load configuration from @p store and remember the store for writes.
 *
 * Must be called once at boot before anything else here. Also clears any
 * bound context. @p store must outlive this module's use.
 */
void node_interface_begin(NodeConfigStore& store);

/** @brief Configuration the node booted with. Never changes at runtime. */
const NodeConfig& node_interface_config();

/** @brief Configuration persisted for the next boot (last successful write). */
const NodeConfig& node_interface_stored_config();

/**
 * @brief Attach the running scheduler context for diagnostic tags.
 *
 * With no context bound, diagnostics read as zero.
 */
void node_interface_bind(NodeContext* ctx);

/** @brief Install the outbound frame writer (nullptr drops frames). */
void node_interface_set_sender(node_frame_sender_t sender);

/**
 * @brief Handle one complete inner frame from the host.
 *
 * Never reads past @p len. Malformed input produces RESP_ERR, never a
 * state change.
 */
void node_interface_on_packet(const uint8_t* frame, size_t len);

/** @brief Unsolicited RESP_OK (seq=0) with TAG_NODE_ADDR. */
void node_interface_send_hello();

/** @brief Emit RX_EVENT for one received radio packet. */
void node_interface_report_rx(const NodeInboundPacket& packet);

/** @brief Emit TX_EVENT for one transmitted radio packet. */
void node_interface_report_tx(uint32_t counter, const NodePayload& payload);

/**
 * @brief Send @p text as an unsolicited MSG frame.
 *
 * Text over 255 bytes is cut to 255 and ends in "...". Signature matches
 * node_log_sink_t so it can be installed as the log sink.
 */
void node_interface_send_text(const char* text);
