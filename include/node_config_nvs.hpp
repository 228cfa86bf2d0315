#pragma once
/**
 * @file node_config_nvs.hpp
 * @brief NodeConfigStore backed by ESP32 NVS (Preferences), namespace "pingnode".
 *
 * Firmware-only. Keys mirror the NodeConfig field names, shortened to fit
 * the 15-character NVS key limit.
 */

#include "node_config.hpp"

#include <Preferences.h>        // ESP32 NVS key/value storage

class NvsConfigStore : public NodeConfigStore {
public:
  NvsConfigStore() : open_(false) {}
  ~NvsConfigStore();

  bool load(NodeConfig& cfg) override;
  bool save(const NodeConfig& cfg) override;

private:
  bool ensure_open();

  Preferences prefs_;
  bool        open_;
};
