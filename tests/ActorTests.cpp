/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE ActorTests
#include <boost/test/unit_test.hpp>

#include "core/ThreadSystem.hpp"
#include "entities/Actor.hpp"
#include "managers/PresenceAggregator.hpp"
#include "managers/ResourcePool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace ColonySim {
std::ostream &operator<<(std::ostream &os, CommandStatus status) {
  return os << commandStatusToString(status);
}
} // namespace ColonySim

using namespace ColonySim;

struct ThreadSystemFixture {
  ThreadSystemFixture() { ThreadSystem::Instance().init(4); }
  ~ThreadSystemFixture() {
    if (!ThreadSystem::Instance().isShutdown()) {
      ThreadSystem::Instance().clean();
    }
  }
};

BOOST_GLOBAL_FIXTURE(ThreadSystemFixture);

namespace {

ResourcePoolConfig testPoolConfig() {
  ResourcePoolConfig config;
  config.seed = 31;
  return config;
}

int inventoryCount(const ActorSnapshot &snapshot, ItemKind kind) {
  auto it = snapshot.inventory.find(kind);
  return it != snapshot.inventory.end() ? it->second : 0;
}

} // namespace

struct ActorFixture {
  ResourcePool pool{testPoolConfig()};
  PresenceAggregator presence{3};
  std::shared_ptr<Actor> actor;

  ActorFixture() {
    actor = Actor::create("actor-1", pool, presence);
    presence.registerActor(actor->getId());
  }

  ~ActorFixture() { actor->stop(); }

  void tick(int count) {
    for (int i = 0; i < count; ++i) {
      BOOST_REQUIRE(actor->onTick());
    }
  }

  ActorSnapshot state() {
    auto snapshot = actor->getState();
    BOOST_REQUIRE(snapshot.has_value());
    return *snapshot;
  }
};

BOOST_FIXTURE_TEST_SUITE(ActorStateTests, ActorFixture)

BOOST_AUTO_TEST_CASE(TestInitialState) {
  const ActorSnapshot snapshot = state();
  BOOST_CHECK_EQUAL(snapshot.id, "actor-1");
  BOOST_CHECK_EQUAL(snapshot.resources.food, 100);
  BOOST_CHECK_EQUAL(snapshot.resources.water, 100);
  BOOST_CHECK_EQUAL(snapshot.resources.energy, 100);
  BOOST_CHECK(snapshot.status == Activity::Idle);
  BOOST_CHECK_EQUAL(snapshot.tickCounter, 0u);
  BOOST_CHECK(!snapshot.foragingLocation.has_value());
  BOOST_CHECK(snapshot.inventory.empty());
  BOOST_CHECK_GT(snapshot.lastUpdated, 0);
  BOOST_CHECK(!actor->isStopped());
}

BOOST_AUTO_TEST_CASE(TestTicksAppliedInOrder) {
  tick(3);
  // getState is queued behind the ticks, so it observes all three
  BOOST_CHECK_EQUAL(state().tickCounter, 3u);
  tick(7);
  const ActorSnapshot snapshot = state();
  BOOST_CHECK_EQUAL(snapshot.tickCounter, 10u);
  BOOST_CHECK_EQUAL(snapshot.resources.food, 98);
  BOOST_CHECK_EQUAL(snapshot.resources.water, 99);
  BOOST_CHECK_EQUAL(snapshot.resources.energy, 100);
}

BOOST_AUTO_TEST_CASE(TestConcurrentTicksAllCounted) {
  constexpr int THREADS = 4;
  constexpr int TICKS_PER_THREAD = 100;

  std::vector<std::thread> threads;
  for (int t = 0; t < THREADS; ++t) {
    threads.emplace_back([this]() {
      for (int i = 0; i < TICKS_PER_THREAD; ++i) {
        actor->onTick();
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  BOOST_CHECK_EQUAL(state().tickCounter,
                    static_cast<uint64_t>(THREADS * TICKS_PER_THREAD));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ActorForagingTests, ActorFixture)

BOOST_AUTO_TEST_CASE(TestBeginForagingSuccess) {
  const CommandResult result = actor->beginForaging("river");
  BOOST_CHECK_EQUAL(result.status, CommandStatus::Success);
  BOOST_CHECK(result.succeeded());
  BOOST_REQUIRE(result.snapshot.has_value());
  BOOST_CHECK(result.snapshot->status == Activity::Foraging);
  BOOST_REQUIRE(result.snapshot->foragingLocation.has_value());
  BOOST_CHECK(*result.snapshot->foragingLocation == LocationId::River);
  BOOST_CHECK_EQUAL(result.snapshot->remainingTicks, 5);

  BOOST_CHECK(*presence.getActivity("actor-1") == Activity::Foraging);
  BOOST_CHECK_EQUAL(presence.getCounters().foragingCount, 1u);
}

BOOST_AUTO_TEST_CASE(TestBeginForagingDefaultsToForest) {
  const CommandResult result = actor->beginForaging();
  BOOST_CHECK_EQUAL(result.status, CommandStatus::Success);
  BOOST_REQUIRE(result.snapshot && result.snapshot->foragingLocation);
  BOOST_CHECK(*result.snapshot->foragingLocation == LocationId::Forest);
}

BOOST_AUTO_TEST_CASE(TestBeginForagingInvalidLocation) {
  const CommandResult result = actor->beginForaging("mountain");
  BOOST_CHECK_EQUAL(result.status, CommandStatus::InvalidLocation);
  BOOST_REQUIRE(result.snapshot.has_value());
  BOOST_CHECK(result.snapshot->status == Activity::Idle);
  BOOST_CHECK(*presence.getActivity("actor-1") == Activity::Idle);
}

BOOST_AUTO_TEST_CASE(TestBeginForagingWhileForaging) {
  BOOST_CHECK(actor->beginForaging("cave").succeeded());
  const uint64_t version = presence.getVersion();

  const CommandResult again = actor->beginForaging("forest");
  BOOST_CHECK_EQUAL(again.status, CommandStatus::AlreadyForaging);
  BOOST_REQUIRE(again.snapshot.has_value());
  BOOST_CHECK(*again.snapshot->foragingLocation == LocationId::Cave);
  BOOST_CHECK_EQUAL(presence.getVersion(), version);

  // Already foraging takes precedence over a bad key
  BOOST_CHECK_EQUAL(actor->beginForaging("nowhere").status,
                    CommandStatus::AlreadyForaging);
}

BOOST_AUTO_TEST_CASE(TestForagingEpisodeHarvestsOnce) {
  pool.setAmount(LocationId::Forest, 20);
  BOOST_REQUIRE(actor->beginForaging("forest").succeeded());

  tick(4);
  ActorSnapshot snapshot = state();
  BOOST_CHECK(snapshot.status == Activity::Foraging);
  BOOST_CHECK_EQUAL(snapshot.remainingTicks, 1);
  BOOST_CHECK_EQUAL(pool.getHarvestCount(), 0u);

  tick(1);
  snapshot = state();
  BOOST_CHECK(snapshot.status == Activity::Idle);
  BOOST_CHECK_EQUAL(snapshot.tickCounter, 5u);
  BOOST_CHECK_EQUAL(pool.getHarvestCount(), 1u);

  const int harvested = 20 - pool.getAmount(LocationId::Forest);
  BOOST_CHECK_GE(harvested, 1);
  BOOST_CHECK_LE(harvested, 5);
  // One food consumed on tick 5, then the harvest credited
  BOOST_CHECK_EQUAL(snapshot.resources.food, 99 + harvested);
  BOOST_CHECK_EQUAL(snapshot.resources.water, 100);
  BOOST_CHECK_EQUAL(snapshot.resources.energy, 100);
  BOOST_CHECK(*presence.getActivity("actor-1") == Activity::Idle);

  // Idle ticks never harvest again
  tick(20);
  state();
  BOOST_CHECK_EQUAL(pool.getHarvestCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestEmptyLocationYieldsNothing) {
  pool.setAmount(LocationId::River, 0);
  BOOST_REQUIRE(actor->beginForaging("river").succeeded());
  tick(5);
  const ActorSnapshot snapshot = state();
  BOOST_CHECK(snapshot.status == Activity::Idle);
  BOOST_CHECK_EQUAL(snapshot.resources.water, 100);
  BOOST_CHECK_EQUAL(pool.getEmptyHarvestCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestForageAgainAfterCompletion) {
  BOOST_REQUIRE(actor->beginForaging("cave").succeeded());
  tick(5);
  BOOST_CHECK(state().status == Activity::Idle);
  BOOST_CHECK(actor->beginForaging("cave").succeeded());
  tick(5);
  state();
  BOOST_CHECK_EQUAL(pool.getHarvestCount(), 2u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ActorInventoryTests, ActorFixture)

BOOST_AUTO_TEST_CASE(TestAddAndRemoveItems) {
  CommandResult result = actor->addItem(ItemKind::Wood, 3);
  BOOST_CHECK_EQUAL(result.status, CommandStatus::Success);
  BOOST_REQUIRE(result.snapshot.has_value());
  BOOST_CHECK_EQUAL(inventoryCount(*result.snapshot, ItemKind::Wood), 3);

  result = actor->removeItem(ItemKind::Wood, 5);
  BOOST_CHECK_EQUAL(result.status, CommandStatus::InsufficientItems);
  BOOST_REQUIRE(result.snapshot.has_value());
  BOOST_CHECK_EQUAL(inventoryCount(*result.snapshot, ItemKind::Wood), 3);

  result = actor->removeItem(ItemKind::Wood, 2);
  BOOST_CHECK_EQUAL(result.status, CommandStatus::Success);
  BOOST_CHECK_EQUAL(inventoryCount(*result.snapshot, ItemKind::Wood), 1);

  result = actor->removeItem(ItemKind::Stone, 1);
  BOOST_CHECK_EQUAL(result.status, CommandStatus::InsufficientItems);
}

BOOST_AUTO_TEST_CASE(TestSubmitCommandVariant) {
  BOOST_CHECK(actor->submitCommand(AddItem{ItemKind::Berries, 4}).succeeded());
  BOOST_CHECK(actor->submitCommand(RemoveItem{ItemKind::Berries, 4}).succeeded());
  const CommandResult result = actor->submitCommand(BeginForaging{"forest"});
  BOOST_CHECK(result.succeeded());
  BOOST_CHECK_EQUAL(inventoryCount(*result.snapshot, ItemKind::Berries), 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ActorObserverTests, ActorFixture)

BOOST_AUTO_TEST_CASE(TestObserverSeesEveryMessage) {
  std::atomic<int> notifications{0};
  std::atomic<uint64_t> lastTick{0};
  const auto id = actor->addObserver([&](const ActorSnapshot &snapshot) {
    notifications++;
    lastTick = snapshot.tickCounter;
  });

  tick(3);
  actor->addItem(ItemKind::Fiber, 1);
  // Observers run before the next message is taken, so the command's
  // return orders them
  BOOST_CHECK_EQUAL(notifications.load(), 4);
  BOOST_CHECK_EQUAL(lastTick.load(), 3u);

  BOOST_CHECK(actor->removeObserver(id));
  BOOST_CHECK(!actor->removeObserver(id));
  tick(1);
  state();
  BOOST_CHECK_EQUAL(notifications.load(), 4);
}

BOOST_AUTO_TEST_CASE(TestThrowingObserverIsContained) {
  actor->addObserver([](const ActorSnapshot &) {
    throw std::runtime_error("observer failure");
  });
  tick(2);
  BOOST_CHECK_EQUAL(state().tickCounter, 2u);
  BOOST_CHECK(actor->beginForaging("forest").succeeded());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ActorStopTests, ActorFixture)

BOOST_AUTO_TEST_CASE(TestStoppedActorRejectsEverything) {
  tick(2);
  state();
  actor->stop();

  BOOST_CHECK(actor->isStopped());
  BOOST_CHECK(!actor->onTick());
  BOOST_CHECK(!actor->getState().has_value());

  const CommandResult result = actor->beginForaging("forest");
  BOOST_CHECK_EQUAL(result.status, CommandStatus::ActorUnavailable);
  BOOST_CHECK(!result.snapshot.has_value());

  // Stopping twice is harmless
  actor->stop();
  BOOST_CHECK(actor->isStopped());
}

BOOST_AUTO_TEST_CASE(TestStopReleasesQueuedCommands) {
  std::mutex gateMutex;
  std::condition_variable gateCondition;
  bool entered = false;
  bool released = false;
  std::atomic<bool> observerDone{false};

  // Hold the mailbox inside the first tick's publish
  actor->addObserver([&](const ActorSnapshot &) {
    {
      std::unique_lock<std::mutex> lock(gateMutex);
      entered = true;
      gateCondition.notify_all();
      gateCondition.wait(lock, [&] { return released; });
    }
    observerDone = true;
  });
  BOOST_REQUIRE(actor->onTick());
  {
    std::unique_lock<std::mutex> lock(gateMutex);
    BOOST_REQUIRE(gateCondition.wait_for(lock, std::chrono::seconds(5),
                                         [&] { return entered; }));
  }

  auto pending = std::async(std::launch::async,
                            [this]() { return actor->beginForaging("forest"); });
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (actor->getPendingMessageCount() == 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  BOOST_REQUIRE_EQUAL(actor->getPendingMessageCount(), 1u);

  actor->stop();
  const CommandResult result = pending.get();
  BOOST_CHECK_EQUAL(result.status, CommandStatus::ActorUnavailable);
  BOOST_CHECK(!result.snapshot.has_value());
  BOOST_CHECK_EQUAL(actor->getPendingMessageCount(), 0u);

  {
    std::lock_guard<std::mutex> lock(gateMutex);
    released = true;
  }
  gateCondition.notify_all();
  while (!observerDone.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  // The command never reached the record
  BOOST_CHECK(*presence.getActivity("actor-1") == Activity::Idle);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ActorInlineDrainTests)

BOOST_AUTO_TEST_CASE(TestActorWithoutSharedOwnerDrainsInline) {
  ResourcePool pool(testPoolConfig());
  PresenceAggregator presence(5);
  Actor actor("solo", pool, presence);
  presence.registerActor("solo");

  // No shared owner means no hand-off to a worker; every post runs here
  BOOST_CHECK(actor.onTick());
  BOOST_CHECK_EQUAL(actor.getPendingMessageCount(), 0u);
  BOOST_CHECK_EQUAL(actor.getProcessedMessageCount(), 1u);

  BOOST_CHECK(actor.beginForaging("river").succeeded());
  for (int i = 0; i < 5; ++i) {
    actor.onTick();
  }
  auto snapshot = actor.getState();
  BOOST_REQUIRE(snapshot.has_value());
  BOOST_CHECK_EQUAL(snapshot->tickCounter, 6u);
  BOOST_CHECK(snapshot->status == Activity::Idle);
  BOOST_CHECK_EQUAL(pool.getHarvestCount(), 1u);
  BOOST_CHECK(*presence.getActivity("solo") == Activity::Idle);
}

BOOST_AUTO_TEST_SUITE_END()

// Shuts the ThreadSystem down for the rest of the process; keep this suite last
BOOST_FIXTURE_TEST_SUITE(ActorShutdownTests, ActorFixture)

BOOST_AUTO_TEST_CASE(TestMailboxQueuedAtShutdownStillDrains) {
  auto &threadSystem = ThreadSystem::Instance();
  const unsigned int workers = threadSystem.getThreadCount();

  // Park every worker so the actor's drain task stays in the queue
  std::mutex gateMutex;
  std::condition_variable gateCondition;
  bool gateOpen = false;
  std::atomic<unsigned int> parked{0};
  for (unsigned int i = 0; i < workers; ++i) {
    BOOST_REQUIRE(threadSystem.enqueueTask([&]() {
      parked.fetch_add(1);
      std::unique_lock<std::mutex> lock(gateMutex);
      gateCondition.wait(lock, [&] { return gateOpen; });
    }));
  }
  while (parked.load() < workers) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  BOOST_REQUIRE(actor->onTick());

  // A caller already blocked on a command queued behind the tick
  std::promise<CommandResult> commandResult;
  auto commandFuture = commandResult.get_future();
  std::thread commander([this, &commandResult]() {
    commandResult.set_value(actor->addItem(ItemKind::Stone, 3));
  });
  while (actor->getPendingMessageCount() < 2) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  std::thread cleaner([&threadSystem]() { threadSystem.clean(); });
  while (!threadSystem.isShutdown()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  {
    std::lock_guard<std::mutex> lock(gateMutex);
    gateOpen = true;
  }
  gateCondition.notify_all();
  cleaner.join();

  BOOST_CHECK(commandFuture.wait_for(std::chrono::seconds(3)) ==
              std::future_status::ready);
  commander.join();
  const CommandResult result = commandFuture.get();
  BOOST_CHECK_EQUAL(result.status, CommandStatus::Success);

  // With the pool gone the mailbox drains on the caller
  BOOST_CHECK_EQUAL(actor->getPendingMessageCount(), 0u);
  const ActorSnapshot snapshot = state();
  BOOST_CHECK_EQUAL(snapshot.tickCounter, 1u);
  BOOST_CHECK_EQUAL(inventoryCount(snapshot, ItemKind::Stone), 3);

  BOOST_REQUIRE(actor->onTick());
  BOOST_CHECK_EQUAL(state().tickCounter, 2u);
}

BOOST_AUTO_TEST_SUITE_END()
