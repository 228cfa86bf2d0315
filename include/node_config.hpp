#pragma once
/**
 * @page pn-node-config PingNode Configuration
 * @file node_config.hpp
 * @brief Node settings: defaults, range checks, and the persistence seam.
 *
 * Overview
 * --------
 * NodeConfig is a plain struct of everything that can differ between two
 * nodes on the bench: addresses, radio parameters, and the three scheduler
 * timings. It is loaded once at boot, validated, and then copied into the
 * scheduler context. Changes made over the host link are validated, written
 * back to storage, and picked up on the next boot. Identity does not change
 * under a running loop.
 *
 * Defaults
 * --------
 *   node_addr       1           dest_addr       2
 *   freq_hz         868 MHz     sf              7
 *   bw_hz           125 kHz     cr              5 (4/5)
 *   tx_pwr_dbm      13
 *   tx_interval_ms  1000        dwell_ms        500
 *   rx_timeout_ms   500
 *
 * When trying this out with two boards, give the second one the reverse
 * addresses (node 2, dest 1).
 *
 * Persistence
 * -----------
 * NodeConfigStore is the only thing that knows where settings live. The
 * firmware uses NvsConfigStore (ESP32 Preferences, see node_config_nvs.hpp);
 * tests use an in-memory store. node_config_load() never hands back an
 * invalid config: anything that fails validation falls back to defaults.
 *
 * @author Leo
 */

#include <cstdint>

/** Local addresses are 1..254; 255 is reserved for broadcast. */
static constexpr uint8_t NODE_ADDR_MIN = 1;
static constexpr uint8_t NODE_ADDR_MAX = 254;

/**
 * @brief Everything a node needs to come up on the channel.
 */
struct NodeConfig {
  uint8_t  node_addr      = 1;
  uint8_t  dest_addr      = 2;

  uint32_t freq_hz        = 868000000;
  uint8_t  sf             = 7;
  uint32_t bw_hz          = 125000;
  uint8_t  cr             = 5;
  int8_t   tx_pwr_dbm     = 13;

  uint32_t tx_interval_ms = 1000;
  uint32_t dwell_ms       = 500;
  uint32_t rx_timeout_ms  = 500;
};

/** First field that failed validation. */
enum NodeConfigError : uint8_t {
  NODE_CONFIG_OK = 0,
  NODE_CONFIG_BAD_NODE_ADDR,
  NODE_CONFIG_BAD_DEST_ADDR,
  NODE_CONFIG_BAD_FREQ,
  NODE_CONFIG_BAD_SF,
  NODE_CONFIG_BAD_BW,
  NODE_CONFIG_BAD_CR,
  NODE_CONFIG_BAD_TX_PWR,
  NODE_CONFIG_BAD_TX_INTERVAL,
  NODE_CONFIG_BAD_DWELL,
  NODE_CONFIG_BAD_RX_TIMEOUT
};

/**
 * @brief Where settings are kept between boots.
 */
class NodeConfigStore {
public:
  virtual ~NodeConfigStore() {}

  /**
   * @brief Overwrite fields of @p cfg with stored values.
   * @return false if storage is unavailable; @p cfg is left untouched.
   */
  virtual bool load(NodeConfig& cfg) = 0;

  /** @return false if the write could not be done. */
  virtual bool save(const NodeConfig& cfg) = 0;
};

// Per-field checks. Shared by node_config_validate() and the host link.
bool node_config_valid_node_addr(uint8_t v);
bool node_config_valid_dest_addr(uint8_t v);
bool node_config_valid_freq(uint32_t hz);
bool node_config_valid_sf(uint8_t v);
bool node_config_valid_bw(uint32_t hz);
bool node_config_valid_cr(uint8_t v);
bool node_config_valid_tx_pwr(int8_t dbm);
bool node_config_valid_tx_interval(uint32_t ms);
bool node_config_valid_rx_timeout(uint32_t ms);

/** Dwell is bounded on its own and must stay shorter than the interval. */
bool node_config_valid_dwell(uint32_t dwell_ms, uint32_t tx_interval_ms);

/**
 * @brief Check every field in declaration order.
 * @return NODE_CONFIG_OK or the first failing field.
 */
NodeConfigError node_config_validate(const NodeConfig& cfg);

/** Short human-readable name for a NodeConfigError ("dest_addr", ...). */
const char* node_config_error_name(NodeConfigError err);

/**
 * @brief Load settings from @p store, falling back to defaults.
 *
 * Starts from NodeConfig{} defaults, overlays whatever the store returns,
 * then validates. If validation fails the whole config is reset to
 * defaults and a [CFG] line is logged.
 */
NodeConfig node_config_load(NodeConfigStore& store);
