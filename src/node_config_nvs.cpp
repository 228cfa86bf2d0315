// node_config_nvs.cpp - implementation for node_config_nvs.hpp
// Firmware-only: talks to ESP32 NVS through the Arduino Preferences wrapper.

#include "node_config_nvs.hpp"

static const char* kNamespace = "pingnode";

NvsConfigStore::~NvsConfigStore() {
  if (open_) prefs_.end();
}

// Open the namespace read/write on first use. If NVS is broken we stay
// closed and every call reports failure.
bool NvsConfigStore::ensure_open() {
  if (!open_) open_ = prefs_.begin(kNamespace, /*readOnly=*/false);
  return open_;
}

//
// load()
// ------
// Each getter takes the in-memory value as its fallback, so keys that were
// never written leave the caller's defaults untouched.
//
bool NvsConfigStore::load(NodeConfig& c) {
  if (!ensure_open()) return false;

  // identity
  c.node_addr      = prefs_.getUChar("node_addr", c.node_addr);
  c.dest_addr      = prefs_.getUChar("dest_addr", c.dest_addr);

  // radio
  c.freq_hz        = prefs_.getULong("freq_hz", c.freq_hz);
  c.sf             = prefs_.getUChar("sf", c.sf);
  c.bw_hz          = prefs_.getULong("bw_hz", c.bw_hz);
  c.cr             = prefs_.getUChar("cr", c.cr);
  c.tx_pwr_dbm     = prefs_.getChar("tx_pwr", c.tx_pwr_dbm);

  // schedule
  c.tx_interval_ms = prefs_.getULong("tx_int_ms", c.tx_interval_ms);
  c.dwell_ms       = prefs_.getULong("dwell_ms", c.dwell_ms);
  c.rx_timeout_ms  = prefs_.getULong("rx_to_ms", c.rx_timeout_ms);
  return true;
}

//
// save()
// ------
// Preferences commits after every put. A put that writes zero bytes means
// the partition is full or failing; report it so the host gets RESP_ERR.
//
bool NvsConfigStore::save(const NodeConfig& c) {
  if (!ensure_open()) return false;

  bool ok = true;
  ok = prefs_.putUChar("node_addr", c.node_addr) > 0 && ok;
  ok = prefs_.putUChar("dest_addr", c.dest_addr) > 0 && ok;
  ok = prefs_.putULong("freq_hz", c.freq_hz) > 0 && ok;
  ok = prefs_.putUChar("sf", c.sf) > 0 && ok;
  ok = prefs_.putULong("bw_hz", c.bw_hz) > 0 && ok;
  ok = prefs_.putUChar("cr", c.cr) > 0 && ok;
  ok = prefs_.putChar("tx_pwr", c.tx_pwr_dbm) > 0 && ok;
  ok = prefs_.putULong("tx_int_ms", c.tx_interval_ms) > 0 && ok;
  ok = prefs_.putULong("dwell_ms", c.dwell_ms) > 0 && ok;
  ok = prefs_.putULong("rx_to_ms", c.rx_timeout_ms) > 0 && ok;
  return ok;
}
