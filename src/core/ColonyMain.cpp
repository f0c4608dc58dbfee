/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/SimulationConfig.hpp"
#include "core/ThreadSystem.hpp"
#include "core/TickScheduler.hpp"
#include "managers/ActorManager.hpp"
#include "managers/PresenceAggregator.hpp"
#include "managers/ResourcePool.hpp"
#include "managers/SettingsManager.hpp"
#include <SDL3/SDL.h>
#include <chrono>
#include <condition_variable>
#include <format>
#include <mutex>
#include <string>
#include <vector>

namespace {

const std::string APP_NAME{"Colony Sim"};
const std::string DEFAULT_SETTINGS_PATH{"res/colony_settings.json"};

// Upper bound on how long the driver waits for in-flight mailbox work
constexpr uint64_t DRAIN_TIMEOUT_MS = 2000;

void waitForWorkers() {
  const uint64_t deadline = SDL_GetTicks() + DRAIN_TIMEOUT_MS;
  auto& threadSystem = ColonySim::ThreadSystem::Instance();
  while (threadSystem.isBusy() && SDL_GetTicks() < deadline) {
    SDL_Delay(1);
  }
}

std::string describePool(const ColonySim::ResourcePool& pool) {
  std::string text;
  for (const auto& [location, amount] : pool.getLocations()) {
    if (!text.empty()) {
      text += ", ";
    }
    text += std::format("{}={}", ColonySim::RulesTraits::locationToString(location), amount);
  }
  return text;
}

} // namespace

int main(int argc, char* argv[]) {
  using namespace ColonySim;

  COLONYMAIN_INFO(std::format("Initializing {}", APP_NAME));

  if (!SDL_Init(0)) {
    COLONYMAIN_CRITICAL(std::format("SDL_Init failed: {}", SDL_GetError()));
    return -1;
  }

  // Load settings before anything reads them
  const std::string settingsPath = argc > 1 ? argv[1] : DEFAULT_SETTINGS_PATH;
  auto& settingsManager = SettingsManager::Instance();
  if (!settingsManager.loadFromFile(settingsPath)) {
    COLONYMAIN_WARN(std::format("Failed to load {} - using defaults", settingsPath));
  }
  const SimulationConfig config = SimulationConfig::fromSettings(settingsManager);

  ThreadSystem& threadSystem = ThreadSystem::Instance();
  if (!threadSystem.init(config.workerCount)) {
    THREADSYSTEM_CRITICAL("Failed to initialize thread system");
    SDL_Quit();
    return -1;
  }

  {
    ResourcePool pool(config.pool);
    PresenceAggregator presence(config.presenceSeed);
    ActorManager actors(pool, presence);
    TickScheduler scheduler(actors, pool, config.tickIntervalMs);

    presence.registerListener([](const PresenceSummary& summary) {
      COLONYMAIN_DEBUG(std::format("Presence v{}: {} total, {} idle, {} foraging",
                                   summary.version, summary.totalCount,
                                   summary.idleCount, summary.foragingCount));
    });

    std::vector<ActorHandle> handles;
    handles.reserve(static_cast<size_t>(config.actorCount));
    for (int i = 0; i < config.actorCount; ++i) {
      handles.push_back(actors.spawn(std::format("colonist-{}", i + 1)));
    }
    COLONYMAIN_INFO(std::format("Spawned {} actors, pool: {}", actors.size(), describePool(pool)));

    std::mutex tickMutex;
    std::condition_variable tickCondition;
    uint64_t lastTick = 0;
    scheduler.setTickListener([&](uint64_t tick) {
      {
        std::lock_guard<std::mutex> lock(tickMutex);
        lastTick = tick;
      }
      tickCondition.notify_one();
    });

    if (config.runTicks > 0 && !scheduler.start()) {
      COLONYMAIN_CRITICAL("Failed to start tick scheduler");
    } else {
      uint64_t handledTick = 0;
      const auto waitLimit = std::chrono::milliseconds(config.tickIntervalMs * 2 + 1000);

      while (handledTick < static_cast<uint64_t>(config.runTicks)) {
        uint64_t tick = 0;
        {
          std::unique_lock<std::mutex> lock(tickMutex);
          if (!tickCondition.wait_for(lock, waitLimit, [&] { return lastTick > handledTick; })) {
            COLONYMAIN_ERROR("Timed out waiting for the next tick");
            break;
          }
          tick = lastTick;
        }
        handledTick = tick;

        // Send idle colonists out, rotating through the locations
        for (size_t i = 0; i < handles.size(); ++i) {
          auto actor = actors.get(handles[i]);
          if (!actor) {
            continue;
          }
          auto state = actor->getState();
          if (!state || state->status != Activity::Idle) {
            continue;
          }
          const auto location = static_cast<LocationId>((i + tick) % LOCATION_COUNT);
          const CommandResult result = actor->beginForaging(RulesTraits::locationToString(location));
          if (!result.succeeded()) {
            COLONYMAIN_DEBUG(std::format("{} could not forage: {}", actor->getId(),
                                         commandStatusToString(result.status)));
          }
        }

        const PresenceSummary summary = presence.getSummary();
        COLONYMAIN_INFO(std::format("Tick {}: {} idle, {} foraging | pool: {}", tick,
                                    summary.idleCount, summary.foragingCount,
                                    describePool(pool)));
      }
    }

    scheduler.stop();
    waitForWorkers();

    for (const auto& handle : handles) {
      if (auto actor = actors.get(handle)) {
        if (auto state = actor->getState()) {
          COLONYMAIN_INFO(std::format("{}: food {}, water {}, energy {}, ticks {}", state->id,
                                      state->resources.food, state->resources.water,
                                      state->resources.energy, state->tickCounter));
        }
      }
    }

    if (!presence.isConsistent()) {
      COLONYMAIN_ERROR("Presence counters disagree with a full recount");
    }

    actors.despawnAll();
    waitForWorkers();
  }

  COLONYMAIN_INFO(std::format("{} shutting down", APP_NAME));
  threadSystem.clean();
  SDL_Quit();
  return 0;
}
