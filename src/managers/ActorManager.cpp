/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ActorManager.hpp"
#include "core/Logger.hpp"
#include "managers/PresenceAggregator.hpp"
#include "managers/ResourcePool.hpp"
#include <format>
#include <mutex>

namespace ColonySim {

ActorManager::ActorManager(ResourcePool &pool, PresenceAggregator &presence)
    : m_pool(pool), m_presence(presence) {}

ActorManager::~ActorManager() { despawnAll(); }

ActorHandle ActorManager::spawn(const ActorId &id) {
  if (id.empty()) {
    ACTORMGR_ERROR("Refusing to spawn actor with empty id");
    return INVALID_ACTOR_HANDLE;
  }

  std::lock_guard<std::mutex> presenceLock(m_presenceMutex);
  ActorHandle handle;
  bool reused = false;
  {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto existing = m_idToHandle.find(id);
    if (existing != m_idToHandle.end()) {
      handle = existing->second;
      reused = true;
    } else {
      ActorHandle::Index index;
      if (!m_freeSlots.empty()) {
        index = m_freeSlots.back();
        m_freeSlots.pop_back();
      } else {
        index = static_cast<ActorHandle::Index>(m_slots.size());
        m_slots.emplace_back();
      }

      Slot &slot = m_slots[index];
      slot.actor = Actor::create(id, m_pool, m_presence);
      handle = ActorHandle{index, slot.generation};
      m_idToHandle.emplace(id, handle);
    }
  }

  m_presence.registerActor(id);

  if (reused) {
    ACTORMGR_DEBUG(std::format("Actor {} already live as {}", id,
                               handle.toString()));
  } else {
    ACTORMGR_INFO(std::format("Spawned actor {} as {}", id, handle.toString()));
  }
  return handle;
}

std::shared_ptr<Actor> ActorManager::releaseSlotLocked(ActorHandle handle) {
  Slot &slot = m_slots[handle.index];
  std::shared_ptr<Actor> actor = std::move(slot.actor);
  slot.actor.reset();

  // Generation 0 is reserved for invalid handles
  ++slot.generation;
  if (slot.generation == ActorHandle::INVALID_GENERATION) {
    slot.generation = 1;
  }
  m_freeSlots.push_back(handle.index);
  if (actor) {
    m_idToHandle.erase(actor->getId());
  }
  return actor;
}

bool ActorManager::despawn(ActorHandle handle) {
  std::lock_guard<std::mutex> presenceLock(m_presenceMutex);
  std::shared_ptr<Actor> actor;
  {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!handle.isValid() || handle.index >= m_slots.size()) {
      return false;
    }
    const Slot &slot = m_slots[handle.index];
    if (slot.generation != handle.generation || !slot.actor) {
      return false;
    }
    actor = releaseSlotLocked(handle);
  }

  // Stop first so an in-flight message can't touch presence after this
  actor->stop();
  m_presence.unregisterActor(actor->getId());
  ACTORMGR_INFO(std::format("Despawned actor {}", actor->getId()));
  return true;
}

bool ActorManager::despawn(const ActorId &id) { return despawn(find(id)); }

void ActorManager::despawnAll() {
  std::lock_guard<std::mutex> presenceLock(m_presenceMutex);
  std::vector<std::shared_ptr<Actor>> actors;
  {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    for (ActorHandle::Index i = 0; i < m_slots.size(); ++i) {
      if (m_slots[i].actor) {
        actors.push_back(releaseSlotLocked(ActorHandle{i, m_slots[i].generation}));
      }
    }
  }

  for (auto &actor : actors) {
    actor->stop();
    m_presence.unregisterActor(actor->getId());
  }
  if (!actors.empty()) {
    ACTORMGR_INFO(std::format("Despawned {} actors", actors.size()));
  }
}

std::shared_ptr<Actor> ActorManager::get(ActorHandle handle) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  if (!handle.isValid() || handle.index >= m_slots.size()) {
    return nullptr;
  }
  const Slot &slot = m_slots[handle.index];
  if (slot.generation != handle.generation) {
    return nullptr;
  }
  return slot.actor;
}

ActorHandle ActorManager::find(const ActorId &id) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  auto it = m_idToHandle.find(id);
  return it != m_idToHandle.end() ? it->second : INVALID_ACTOR_HANDLE;
}

bool ActorManager::isAlive(ActorHandle handle) const {
  return get(handle) != nullptr;
}

std::vector<std::shared_ptr<Actor>> ActorManager::liveActors() const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  std::vector<std::shared_ptr<Actor>> actors;
  actors.reserve(m_idToHandle.size());
  for (const auto &slot : m_slots) {
    if (slot.actor) {
      actors.push_back(slot.actor);
    }
  }
  return actors;
}

std::vector<ActorHandle> ActorManager::liveHandles() const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  std::vector<ActorHandle> handles;
  handles.reserve(m_idToHandle.size());
  for (ActorHandle::Index i = 0; i < m_slots.size(); ++i) {
    if (m_slots[i].actor) {
      handles.emplace_back(i, m_slots[i].generation);
    }
  }
  return handles;
}

size_t ActorManager::size() const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  return m_idToHandle.size();
}

size_t ActorManager::capacity() const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  return m_slots.size();
}

} // namespace ColonySim
