/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/TickScheduler.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/ActorManager.hpp"
#include "managers/ResourcePool.hpp"
#include <SDL3/SDL.h>
#include <format>

namespace ColonySim {

TickScheduler::TickScheduler(ActorManager &actors, ResourcePool &pool,
                             uint32_t intervalMs)
    : m_actors(actors), m_pool(pool),
      m_intervalMs(intervalMs > 0 ? intervalMs : DEFAULT_TICK_INTERVAL_MS) {
  if (intervalMs == 0) {
    SCHEDULER_WARN(std::format("Tick interval of 0ms rejected, using {}ms",
                               DEFAULT_TICK_INTERVAL_MS));
  }
}

TickScheduler::~TickScheduler() { stop(); }

bool TickScheduler::start() {
  std::lock_guard<std::mutex> lock(m_controlMutex);
  if (m_running.load(std::memory_order_acquire)) {
    return true;
  }

  // Without workers every mailbox would drain on the timer thread
  if (!ThreadSystem::Exists()) {
    SCHEDULER_ERROR("Cannot start tick timer without a running ThreadSystem");
    return false;
  }

  m_running.store(true, std::memory_order_release);
  m_timerId = SDL_AddTimer(m_intervalMs, &TickScheduler::timerCallback, this);
  if (m_timerId == 0) {
    m_running.store(false, std::memory_order_release);
    SCHEDULER_ERROR(std::format("Failed to create tick timer: {}", SDL_GetError()));
    return false;
  }

  SCHEDULER_INFO(std::format("Tick scheduler started ({}ms interval)",
                             m_intervalMs));
  return true;
}

void TickScheduler::stop() {
  std::lock_guard<std::mutex> controlLock(m_controlMutex);
  if (!m_running.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  const SDL_TimerID timerId = m_timerId;
  m_timerId = 0;
  if (timerId != 0 && !SDL_RemoveTimer(timerId)) {
    // The callback already saw m_running == false and returned 0
    SCHEDULER_DEBUG(std::format("Tick timer already gone: {}", SDL_GetError()));
  }

  // Wait out a firing that was already in progress
  std::lock_guard<std::mutex> fireLock(m_fireMutex);
  SCHEDULER_INFO(std::format("Tick scheduler stopped after {} ticks",
                             m_tickCount.load(std::memory_order_acquire)));
}

uint64_t TickScheduler::fireTick() {
  std::lock_guard<std::mutex> lock(m_fireMutex);
  return fanOutLocked();
}

void TickScheduler::setTickListener(TickListener listener) {
  std::lock_guard<std::mutex> lock(m_listenerMutex);
  m_tickListener = std::move(listener);
}

uint64_t TickScheduler::fanOutLocked() {
  const uint64_t tick = m_tickCount.fetch_add(1, std::memory_order_acq_rel) + 1;
  m_lastTickTimeMs.store(SDL_GetTicks(), std::memory_order_relaxed);

  // Snapshot first so despawns during the fan-out can't invalidate iteration
  const auto actors = m_actors.liveActors();
  for (const auto &actor : actors) {
    if (!actor->onTick()) {
      // Stopped between snapshot and delivery, drop it
      m_droppedDeliveries.fetch_add(1, std::memory_order_relaxed);
    }
  }

  ResourcePool *pool = &m_pool;
  const bool queued =
      ThreadSystem::Exists() &&
      ThreadSystem::Instance().enqueueTask([pool]() { pool->regrowthTick(); },
                                           TaskPriority::Normal,
                                           "Pool regrowth");
  if (!queued) {
    m_pool.regrowthTick();
  }

  SCHEDULER_DEBUG(std::format("Tick {} issued to {} actors", tick, actors.size()));

  TickListener listener;
  {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    listener = m_tickListener;
  }
  if (listener) {
    try {
      listener(tick);
    } catch (const std::exception &e) {
      SCHEDULER_ERROR(std::format("Tick listener threw: {}", e.what()));
    }
  }
  return tick;
}

Uint32 SDLCALL TickScheduler::timerCallback(void *userdata,
                                            SDL_TimerID /*timerId*/,
                                            Uint32 interval) {
  auto *self = static_cast<TickScheduler *>(userdata);
  std::lock_guard<std::mutex> lock(self->m_fireMutex);
  if (!self->m_running.load(std::memory_order_acquire)) {
    return 0;
  }
  if (!ThreadSystem::Exists()) {
    self->m_running.store(false, std::memory_order_release);
    SCHEDULER_ERROR("ThreadSystem went down, tick timer disarmed");
    return 0;
  }

  self->fanOutLocked();

  // Returning the interval re-arms the timer now that the fan-out is issued
  return self->m_running.load(std::memory_order_acquire) ? interval : 0;
}

} // namespace ColonySim
