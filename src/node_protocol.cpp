// -----------------------------------------------------------------------------
// node_protocol.cpp
// SLIP transport for the host link declared in node_protocol.hpp.
//
// Notes:
//  * Frame meaning lives in node_interface.*; this file only moves bytes.
//  * Firmware-only: PacketSerial drives the Arduino Serial object.
//  * Both directions are bounded by NODE_PROTOCOL_MAX_FRAME.
// -----------------------------------------------------------------------------

#include "node_protocol.hpp"     // NODE_PROTOCOL_MAX_FRAME, transport API
#include "node_interface.hpp"    // default handler: node_interface_on_packet

#include <Arduino.h>             // Serial
#include <PacketSerial.h>        // SLIP framing over a Stream


// The stock SLIPPacketSerial decodes into 256 bytes, three short of a full
// frame. Size the decoder for the largest frame plus slack for a partial
// next packet.
typedef PacketSerial_<SLIP, SLIP::END, 2 * NODE_PROTOCOL_MAX_FRAME> NodeSlipSerial;

static NodeSlipSerial s_slip;

// Set by node_protocol_begin(). Log lines emitted before that are dropped
// instead of going to an unconfigured stream.
static bool s_open = false;

// Installed handler; null routes frames to node_interface_on_packet().
static void (*s_handler)(const uint8_t* frame, size_t len) = nullptr;

//
// on_slip_packet()
// ----------------
// PacketSerial callback, one decoded frame per call.
//
// Flow:
//   1) Frames longer than any valid frame are line noise or two frames run
//      together; drop them before anyone parses a length byte.
//   2) Everything else goes to the installed handler (or the default).
//
static void on_slip_packet(const uint8_t* buffer, size_t size) {
    // 1) size guard
    if (size > NODE_PROTOCOL_MAX_FRAME) return;

    // 2) dispatch
    if (s_handler) {
        s_handler(buffer, size);
    } else {
        node_interface_on_packet(buffer, size);
    }
}

void node_protocol_begin(unsigned long baud) {
    Serial.begin(baud);
    s_slip.setStream(&Serial);
    s_slip.setPacketHandler(&on_slip_packet);
    s_open = true;
}

// Non-blocking; PacketSerial reads whatever Serial has buffered.
void node_protocol_update() {
    if (s_open) s_slip.update();
}

void node_protocol_set_handler(void (*handler)(const uint8_t* frame, size_t len)) {
    s_handler = handler;
}

void protocol_send(const uint8_t* frame, size_t len) {
    if (!s_open || !frame || len == 0) return;   // nothing attached / nothing to say
    if (len > NODE_PROTOCOL_MAX_FRAME) return;   // callers build frames within bounds
    s_slip.send(frame, len);
}
