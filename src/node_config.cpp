// node_config.cpp - implementation for node_config.hpp
// Range checks are plain comparisons; no table lookups except bandwidth.

#include "node_config.hpp"
#include "node_log.hpp"

#include <cstddef>

// SX127x LoRa bandwidth steps (Hz). Anything else is rejected.
static const uint32_t kBandwidths[] = {
  7800, 10400, 15600, 20800, 31250, 41700, 62500, 125000, 250000, 500000
};

bool node_config_valid_node_addr(uint8_t v)   { return v >= NODE_ADDR_MIN && v <= NODE_ADDR_MAX; }
bool node_config_valid_dest_addr(uint8_t v)   { return v >= NODE_ADDR_MIN; }   // 255 = broadcast
bool node_config_valid_freq(uint32_t hz)      { return hz >= 137000000UL && hz <= 1020000000UL; }
bool node_config_valid_sf(uint8_t v)          { return v >= 7 && v <= 12; }
bool node_config_valid_cr(uint8_t v)          { return v >= 5 && v <= 8; }
bool node_config_valid_tx_pwr(int8_t dbm)     { return dbm >= 2 && dbm <= 20; }
bool node_config_valid_tx_interval(uint32_t ms) { return ms >= 100 && ms <= 3600000UL; }
bool node_config_valid_rx_timeout(uint32_t ms)  { return ms <= 10000; }

bool node_config_valid_bw(uint32_t hz) {
  for (size_t i = 0; i < sizeof(kBandwidths) / sizeof(kBandwidths[0]); ++i) {
    if (kBandwidths[i] == hz) return true;
  }
  return false;
}

bool node_config_valid_dwell(uint32_t dwell_ms, uint32_t tx_interval_ms) {
  return dwell_ms <= 10000 && dwell_ms < tx_interval_ms;
}

NodeConfigError node_config_validate(const NodeConfig& c) {
  if (!node_config_valid_node_addr(c.node_addr))        return NODE_CONFIG_BAD_NODE_ADDR;
  if (!node_config_valid_dest_addr(c.dest_addr))        return NODE_CONFIG_BAD_DEST_ADDR;
  if (!node_config_valid_freq(c.freq_hz))               return NODE_CONFIG_BAD_FREQ;
  if (!node_config_valid_sf(c.sf))                      return NODE_CONFIG_BAD_SF;
  if (!node_config_valid_bw(c.bw_hz))                   return NODE_CONFIG_BAD_BW;
  if (!node_config_valid_cr(c.cr))                      return NODE_CONFIG_BAD_CR;
  if (!node_config_valid_tx_pwr(c.tx_pwr_dbm))          return NODE_CONFIG_BAD_TX_PWR;
  if (!node_config_valid_tx_interval(c.tx_interval_ms)) return NODE_CONFIG_BAD_TX_INTERVAL;
  if (!node_config_valid_dwell(c.dwell_ms, c.tx_interval_ms)) return NODE_CONFIG_BAD_DWELL;
  if (!node_config_valid_rx_timeout(c.rx_timeout_ms))   return NODE_CONFIG_BAD_RX_TIMEOUT;
  return NODE_CONFIG_OK;
}

const char* node_config_error_name(NodeConfigError err) {
  switch (err) {
    case NODE_CONFIG_OK:              return "ok";
    case NODE_CONFIG_BAD_NODE_ADDR:   return "node_addr";
    case NODE_CONFIG_BAD_DEST_ADDR:   return "dest_addr";
    case NODE_CONFIG_BAD_FREQ:        return "freq_hz";
    case NODE_CONFIG_BAD_SF:          return "sf";
    case NODE_CONFIG_BAD_BW:          return "bw_hz";
    case NODE_CONFIG_BAD_CR:          return "cr";
    case NODE_CONFIG_BAD_TX_PWR:      return "tx_pwr_dbm";
    case NODE_CONFIG_BAD_TX_INTERVAL: return "tx_interval_ms";
    case NODE_CONFIG_BAD_DWELL:       return "dwell_ms";
    case NODE_CONFIG_BAD_RX_TIMEOUT:  return "rx_timeout_ms";
  }
  return "unknown";
}

//
// node_config_load()
// ------------------
// Phases:
//   1) Start from compiled-in defaults.
//   2) Overlay stored values (a missing store keeps defaults).
//   3) Validate as a whole; any bad field resets every field, never just
//      the bad one.
//
NodeConfig node_config_load(NodeConfigStore& store) {
  NodeConfig cfg;
  if (!store.load(cfg)) {
    node_log("CFG", "storage unavailable, using defaults");
    return NodeConfig();
  }

  NodeConfigError err = node_config_validate(cfg);
  if (err != NODE_CONFIG_OK) {
    node_log("CFG", "stored %s invalid, using defaults", node_config_error_name(err));
    return NodeConfig();
  }
  return cfg;
}
