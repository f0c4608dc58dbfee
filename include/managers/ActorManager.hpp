/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTOR_MANAGER_HPP
#define ACTOR_MANAGER_HPP

#include "entities/Actor.hpp"
#include "entities/ActorHandle.hpp"
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ColonySim {

class ResourcePool;
class PresenceAggregator;

/**
 * @brief Arena of live actors addressed by generation-checked handles
 *
 * spawn() hands back a handle that the caller keeps; there is no global
 * name lookup on the hot path. find() exists for reconnect-style flows
 * where only the id is known.
 *
 * Spawn and despawn are serialized, and each one keeps the arena and the
 * presence aggregator in step: a live id always has a presence record and
 * a despawned actor never updates presence again. Presence calls happen
 * outside the arena lock, so presence listeners may use the read-only
 * accessors, but they must not spawn or despawn.
 */
class ActorManager {
public:
  ActorManager(ResourcePool &pool, PresenceAggregator &presence);
  ~ActorManager();

  ActorManager(const ActorManager &) = delete;
  ActorManager &operator=(const ActorManager &) = delete;

  /**
   * @brief Create an actor and register it with presence
   *
   * Spawning an id that is already live returns the existing handle and
   * re-registers presence (a no-op if the record is still there).
   *
   * @return Handle to the actor, INVALID_ACTOR_HANDLE for an empty id
   */
  ActorHandle spawn(const ActorId &id);

  /**
   * @brief Free the actor's slot, stop it and unregister its presence
   * @return false for stale or invalid handles
   */
  bool despawn(ActorHandle handle);
  bool despawn(const ActorId &id);
  void despawnAll();

  // Null for stale handles
  std::shared_ptr<Actor> get(ActorHandle handle) const;
  ActorHandle find(const ActorId &id) const;
  bool isAlive(ActorHandle handle) const;

  // Point-in-time copies; actors despawned afterwards are simply stopped
  std::vector<std::shared_ptr<Actor>> liveActors() const;
  std::vector<ActorHandle> liveHandles() const;

  size_t size() const;
  size_t capacity() const;

private:
  struct Slot {
    std::shared_ptr<Actor> actor{};
    ActorHandle::Generation generation{1};
  };

  ResourcePool &m_pool;
  PresenceAggregator &m_presence;

  // Taken before m_mutex; held across an arena change and its presence change
  std::mutex m_presenceMutex{};
  mutable std::shared_mutex m_mutex{};
  std::vector<Slot> m_slots{};
  std::vector<ActorHandle::Index> m_freeSlots{};
  std::unordered_map<ActorId, ActorHandle> m_idToHandle{};

  // Callers hold m_mutex exclusively; returns the stopped actor
  std::shared_ptr<Actor> releaseSlotLocked(ActorHandle handle);
};

} // namespace ColonySim

#endif // ACTOR_MANAGER_HPP
