/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE ColonySimulationIntegrationTests
#include <boost/test/unit_test.hpp>

#include "core/ThreadSystem.hpp"
#include "core/TickScheduler.hpp"
#include "managers/ActorManager.hpp"
#include "managers/PresenceAggregator.hpp"
#include "managers/ResourcePool.hpp"
#include <SDL3/SDL.h>
#include <atomic>
#include <chrono>
#include <format>
#include <mutex>
#include <thread>
#include <vector>

using namespace ColonySim;

// Full stack: SDL timers, ThreadSystem workers draining mailboxes and
// running regrowth, and the aggregator watching every transition.
struct ColonyStackFixture {
  ColonyStackFixture() {
    if (!SDL_Init(0)) {
      BOOST_TEST_MESSAGE(std::format("SDL_Init failed: {}", SDL_GetError()));
    }
    ThreadSystem::Instance().init(4);
  }
  ~ColonyStackFixture() {
    if (!ThreadSystem::Instance().isShutdown()) {
      ThreadSystem::Instance().clean();
    }
    SDL_Quit();
  }
};

BOOST_GLOBAL_FIXTURE(ColonyStackFixture);

namespace {

ResourcePoolConfig testPoolConfig(uint64_t seed) {
  ResourcePoolConfig config;
  config.seed = seed;
  return config;
}

template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

} // namespace

struct ColonyFixture {
  ResourcePool pool{testPoolConfig(2025)};
  PresenceAggregator presence{77};
  ActorManager actors{pool, presence};
  TickScheduler scheduler{actors, pool, 20};

  ~ColonyFixture() {
    scheduler.stop();
    actors.despawnAll();
    waitFor([] { return !ThreadSystem::Instance().isBusy(); },
            std::chrono::milliseconds(2000));
  }
};

BOOST_FIXTURE_TEST_SUITE(ForagingScenarioTests, ColonyFixture)

BOOST_AUTO_TEST_CASE(TestForestForagingOverFiveTicks) {
  const ActorHandle handle = actors.spawn("settler");
  auto actor = actors.get(handle);
  BOOST_REQUIRE(actor);

  const int forestBefore = pool.getAmount(LocationId::Forest);
  BOOST_REQUIRE_GT(forestBefore, 0);

  const CommandResult begin = actor->beginForaging("forest");
  BOOST_REQUIRE(begin.succeeded());
  BOOST_REQUIRE(begin.snapshot.has_value());
  BOOST_CHECK(begin.snapshot->status == Activity::Foraging);
  BOOST_CHECK_EQUAL(begin.snapshot->remainingTicks, FORAGING_DURATION_TICKS);
  BOOST_CHECK_EQUAL(presence.getCounters().foragingCount, 1u);

  for (int i = 0; i < FORAGING_DURATION_TICKS; ++i) {
    scheduler.fireTick();
  }

  // getState() queues behind the five ticks, so they have all been applied
  auto state = actor->getState();
  BOOST_REQUIRE(state.has_value());
  BOOST_CHECK_EQUAL(state->tickCounter, 5u);
  BOOST_CHECK(state->status == Activity::Idle);
  BOOST_CHECK(!state->foragingLocation.has_value());

  BOOST_CHECK_EQUAL(pool.getHarvestCount(), 1u);
  const int harvested = static_cast<int>(pool.getTotalHarvested());
  BOOST_CHECK_GE(harvested, 1);
  BOOST_CHECK_LE(harvested, 5);
  BOOST_CHECK_EQUAL(pool.getAmount(LocationId::Forest), forestBefore - harvested);

  // Food dropped by one on tick 5 and then took the harvest
  BOOST_CHECK_EQUAL(state->resources.food, 99 + harvested);
  BOOST_CHECK_EQUAL(state->resources.water, 100);
  BOOST_CHECK_EQUAL(state->resources.energy, 100);

  BOOST_CHECK_EQUAL(presence.getCounters().idleCount, 1u);
  BOOST_CHECK_EQUAL(presence.getCounters().foragingCount, 0u);
  BOOST_CHECK(presence.isConsistent());
}

BOOST_AUTO_TEST_CASE(TestForagingFromDrainedLocation) {
  pool.setAmount(LocationId::Cave, 0);
  const ActorHandle handle = actors.spawn("miner");
  auto actor = actors.get(handle);
  BOOST_REQUIRE(actor->beginForaging("cave").succeeded());

  for (int i = 0; i < FORAGING_DURATION_TICKS; ++i) {
    scheduler.fireTick();
  }

  auto state = actor->getState();
  BOOST_REQUIRE(state.has_value());
  BOOST_CHECK(state->status == Activity::Idle);
  BOOST_CHECK_EQUAL(pool.getEmptyHarvestCount(), 1u);
  BOOST_CHECK_EQUAL(pool.getTotalHarvested(), 0u);
  BOOST_CHECK_EQUAL(state->resources.energy, 100);
}

BOOST_AUTO_TEST_CASE(TestRegrowthRunsOnWorkers) {
  pool.setAmount(LocationId::Forest, 0);
  const int interval = pool.getLocationConfig(LocationId::Forest).regrowthInterval;

  for (int i = 0; i < interval; ++i) {
    scheduler.fireTick();
  }

  BOOST_REQUIRE(waitFor([&] { return pool.getRegrowthTickCount() >= static_cast<uint64_t>(interval); },
                        std::chrono::milliseconds(3000)));
  BOOST_CHECK_GE(pool.getAmount(LocationId::Forest), 10);
  BOOST_CHECK_LE(pool.getAmount(LocationId::Forest), 30);
  BOOST_CHECK_GE(pool.getRegrowthEventCount(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ColonyRunTests, ColonyFixture)

BOOST_AUTO_TEST_CASE(TestManyActorsUnderTimer) {
  constexpr int ACTOR_COUNT = 16;
  std::vector<ActorHandle> handles;
  for (int i = 0; i < ACTOR_COUNT; ++i) {
    handles.push_back(actors.spawn(std::format("colonist-{}", i)));
  }

  std::mutex summaryMutex;
  uint64_t lastVersion = 0;
  size_t staleSummaries = 0;
  PresenceCounters latest{};
  const auto listenerId = presence.registerListener([&](const PresenceSummary &summary) {
    std::lock_guard<std::mutex> lock(summaryMutex);
    if (summary.version <= lastVersion) {
      ++staleSummaries;
      return;
    }
    lastVersion = summary.version;
    latest = summary.counters();
  });

  // Half the colony goes out foraging across the three locations
  const char *locations[] = {"forest", "river", "cave"};
  for (int i = 0; i < ACTOR_COUNT; i += 2) {
    auto actor = actors.get(handles[i]);
    BOOST_REQUIRE(actor->beginForaging(locations[(i / 2) % 3]).succeeded());
  }
  BOOST_CHECK_EQUAL(presence.getCounters().foragingCount, static_cast<size_t>(ACTOR_COUNT / 2));

  BOOST_REQUIRE(scheduler.start());
  BOOST_CHECK(waitFor([&] { return scheduler.getTickCount() >= 8; },
                      std::chrono::milliseconds(5000)));
  scheduler.stop();

  const uint64_t ticks = scheduler.getTickCount();
  for (const auto &handle : handles) {
    auto state = actors.get(handle)->getState();
    BOOST_REQUIRE(state.has_value());
    BOOST_CHECK_EQUAL(state->tickCounter, ticks);
    BOOST_CHECK(state->status == Activity::Idle);
  }

  BOOST_CHECK_EQUAL(pool.getHarvestCount(), static_cast<uint64_t>(ACTOR_COUNT / 2));
  BOOST_CHECK_EQUAL(scheduler.getDroppedDeliveryCount(), 0u);

  const PresenceCounters counters = presence.getCounters();
  BOOST_CHECK_EQUAL(counters.totalCount, static_cast<size_t>(ACTOR_COUNT));
  BOOST_CHECK_EQUAL(counters.idleCount, static_cast<size_t>(ACTOR_COUNT));
  BOOST_CHECK_EQUAL(counters.foragingCount, 0u);
  BOOST_CHECK(presence.isConsistent());

  presence.unregisterListener(listenerId);
  std::lock_guard<std::mutex> lock(summaryMutex);
  BOOST_CHECK(latest == counters);
  BOOST_CHECK_EQUAL(lastVersion, presence.getVersion());
  BOOST_TEST_MESSAGE(std::format("Discarded {} out-of-order summaries", staleSummaries));
}

BOOST_AUTO_TEST_CASE(TestDespawnDuringRun) {
  constexpr int ACTOR_COUNT = 8;
  std::vector<ActorHandle> handles;
  for (int i = 0; i < ACTOR_COUNT; ++i) {
    handles.push_back(actors.spawn(std::format("worker-{}", i)));
  }

  BOOST_REQUIRE(scheduler.start());
  BOOST_CHECK(waitFor([&] { return scheduler.getTickCount() >= 2; },
                      std::chrono::milliseconds(3000)));

  for (int i = 0; i < ACTOR_COUNT; i += 2) {
    BOOST_CHECK(actors.despawn(handles[i]));
  }

  const uint64_t afterDespawn = scheduler.getTickCount();
  BOOST_CHECK(waitFor([&] { return scheduler.getTickCount() >= afterDespawn + 2; },
                      std::chrono::milliseconds(3000)));
  scheduler.stop();

  BOOST_CHECK_EQUAL(actors.size(), static_cast<size_t>(ACTOR_COUNT / 2));
  for (int i = 1; i < ACTOR_COUNT; i += 2) {
    auto state = actors.get(handles[i])->getState();
    BOOST_REQUIRE(state.has_value());
    BOOST_CHECK_EQUAL(state->tickCounter, scheduler.getTickCount());
  }

  const PresenceCounters counters = presence.getCounters();
  BOOST_CHECK_EQUAL(counters.totalCount, static_cast<size_t>(ACTOR_COUNT / 2));
  BOOST_CHECK(presence.isConsistent());
}

BOOST_AUTO_TEST_SUITE_END()
