/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TICK_SCHEDULER_HPP
#define TICK_SCHEDULER_HPP

#include <SDL3/SDL_timer.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>

namespace ColonySim {

class ActorManager;
class ResourcePool;

/**
 * @brief Drives every live actor and the resource pool in lockstep
 *
 * Each firing snapshots the live actor set, posts onTick() to every actor
 * and hands one regrowthTick() to the ThreadSystem. Nothing in the fan-out
 * waits for an actor or the pool to finish.
 *
 * Timing comes from a self-rescheduling SDL timer: the next period is armed
 * when the current fan-out returns, so drift accumulates and wall-clock
 * periodicity is not guaranteed. Tick N is always issued before tick N+1.
 */
class TickScheduler {
public:
  // Called after each fan-out with the tick number; must not block or call
  // stop()/fireTick()
  using TickListener = std::function<void(uint64_t)>;

  static constexpr uint32_t DEFAULT_TICK_INTERVAL_MS = 5000;

  TickScheduler(ActorManager &actors, ResourcePool &pool,
                uint32_t intervalMs = DEFAULT_TICK_INTERVAL_MS);
  ~TickScheduler();

  TickScheduler(const TickScheduler &) = delete;
  TickScheduler &operator=(const TickScheduler &) = delete;

  /**
   * @brief Arm the periodic timer
   *
   * Requires a running ThreadSystem. The timer disarms itself if the
   * ThreadSystem shuts down while it is running.
   * @return false if no ThreadSystem is running or the timer could not be
   *         created
   */
  bool start();

  /**
   * @brief Disarm the timer and wait for an in-flight firing to finish
   */
  void stop();

  bool isRunning() const { return m_running.load(std::memory_order_acquire); }

  /**
   * @brief Run one firing on the calling thread
   *
   * Works without a ThreadSystem, in which case each mailbox and the
   * regrowth step run inline before this returns.
   * @return The number of the tick that was issued
   */
  uint64_t fireTick();

  uint64_t getTickCount() const {
    return m_tickCount.load(std::memory_order_acquire);
  }
  uint32_t getIntervalMs() const { return m_intervalMs; }

  // Deliveries skipped because the actor had already been stopped
  uint64_t getDroppedDeliveryCount() const {
    return m_droppedDeliveries.load(std::memory_order_relaxed);
  }
  uint64_t getLastTickTimeMs() const {
    return m_lastTickTimeMs.load(std::memory_order_relaxed);
  }

  void setTickListener(TickListener listener);

private:
  ActorManager &m_actors;
  ResourcePool &m_pool;
  const uint32_t m_intervalMs;

  std::atomic<bool> m_running{false};
  std::atomic<uint64_t> m_tickCount{0};
  std::atomic<uint64_t> m_droppedDeliveries{0};
  std::atomic<uint64_t> m_lastTickTimeMs{0};
  std::mutex m_controlMutex{}; // start/stop and m_timerId
  SDL_TimerID m_timerId{0};

  // Held for the duration of a firing; serializes timer and manual ticks
  std::mutex m_fireMutex{};
  std::mutex m_listenerMutex{};
  TickListener m_tickListener{};

  // Caller holds m_fireMutex
  uint64_t fanOutLocked();

  static Uint32 SDLCALL timerCallback(void *userdata, SDL_TimerID timerId,
                                      Uint32 interval);
};

} // namespace ColonySim

#endif // TICK_SCHEDULER_HPP
