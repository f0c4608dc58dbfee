/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SimulationConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <format>
#include <string>

namespace ColonySim {

namespace {

constexpr const char *CONFIG_SYSTEM = "SimulationConfig";

// Seeds are ints in JSON; a negative value means "pick one at random"
std::optional<uint64_t> readSeed(const SettingsManager &settings,
                                 const std::string &category) {
  if (!settings.has(category, "seed")) {
    return std::nullopt;
  }
  const int seed = settings.get<int>(category, "seed", -1);
  if (seed < 0) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(seed);
}

LocationConfig readLocation(const SettingsManager &settings,
                            LocationId location) {
  const LocationConfig defaults = LocationConfig::defaultFor(location);
  const std::string category =
      std::string("location.") + RulesTraits::locationToString(location);

  LocationConfig config = defaults;
  config.regrowthInterval = settings.get<int>(category, "regrowth_interval",
                                              defaults.regrowthInterval);
  config.regrowthMin =
      settings.get<int>(category, "regrowth_min", defaults.regrowthMin);
  config.regrowthMax =
      settings.get<int>(category, "regrowth_max", defaults.regrowthMax);
  config.harvestMin =
      settings.get<int>(category, "harvest_min", defaults.harvestMin);
  config.harvestMax =
      settings.get<int>(category, "harvest_max", defaults.harvestMax);

  if (!config.isValid()) {
    COLONY_ERROR(CONFIG_SYSTEM,
                 std::format("Invalid settings for {}, using defaults "
                             "(interval {}, regrowth [{}, {}], harvest [{}, {}])",
                             category, config.regrowthInterval,
                             config.regrowthMin, config.regrowthMax,
                             config.harvestMin, config.harvestMax));
    return defaults;
  }
  return config;
}

} // anonymous namespace

SimulationConfig SimulationConfig::fromSettings(const SettingsManager &settings) {
  SimulationConfig config;

  const int interval = settings.get<int>(
      "scheduler", "tick_interval_ms", static_cast<int>(config.tickIntervalMs));
  if (interval > 0) {
    config.tickIntervalMs = static_cast<uint32_t>(interval);
  } else {
    COLONY_ERROR(CONFIG_SYSTEM,
                 std::format("scheduler.tick_interval_ms must be positive, "
                             "got {}; using {}",
                             interval, config.tickIntervalMs));
  }

  const int workers = settings.get<int>("threads", "worker_count", 0);
  if (workers >= 0) {
    config.workerCount = static_cast<unsigned int>(workers);
  } else {
    COLONY_ERROR(CONFIG_SYSTEM,
                 std::format("threads.worker_count must not be negative, got {}",
                             workers));
  }

  config.presenceSeed = readSeed(settings, "presence");
  config.pool.seed = readSeed(settings, "pool");

  for (size_t i = 0; i < LOCATION_COUNT; ++i) {
    config.pool.locations[i] =
        readLocation(settings, static_cast<LocationId>(i));
  }

  const int actorCount =
      settings.get<int>("driver", "actor_count", config.actorCount);
  if (actorCount >= 0) {
    config.actorCount = actorCount;
  } else {
    COLONY_ERROR(CONFIG_SYSTEM, std::format("driver.actor_count must not be "
                                            "negative, got {}",
                                            actorCount));
  }

  const int runTicks = settings.get<int>("driver", "run_ticks", config.runTicks);
  if (runTicks >= 0) {
    config.runTicks = runTicks;
  } else {
    COLONY_ERROR(CONFIG_SYSTEM,
                 std::format("driver.run_ticks must not be negative, got {}",
                             runTicks));
  }

  return config;
}

} // namespace ColonySim
