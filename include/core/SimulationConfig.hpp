/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include "managers/ResourcePool.hpp"
#include <cstdint>
#include <optional>

namespace ColonySim {

class SettingsManager;

/**
 * @brief Typed view of the simulation settings
 *
 * Every field starts at the reference configuration. fromSettings() only
 * overrides what the settings actually contain and rejects (with a logged
 * error) values outside their valid range.
 */
struct SimulationConfig {
  uint32_t tickIntervalMs{5000};
  unsigned int workerCount{0}; // 0 picks from hardware_concurrency
  std::optional<uint64_t> presenceSeed{};
  ResourcePoolConfig pool{};

  // Driver executable only
  int actorCount{8};
  int runTicks{20};

  bool isValid() const {
    return tickIntervalMs > 0 && pool.isValid() && actorCount >= 0 &&
           runTicks >= 0;
  }

  static SimulationConfig fromSettings(const SettingsManager &settings);
};

} // namespace ColonySim

#endif // SIMULATION_CONFIG_HPP
