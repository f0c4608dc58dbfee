/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTOR_HANDLE_HPP
#define ACTOR_HANDLE_HPP

#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <string>

namespace ColonySim {

/**
 * @brief Lightweight handle for referencing actors in the ActorManager arena
 *
 * A handle is a slot index plus the generation the slot had when the actor
 * was spawned. Despawning bumps the slot's generation, so handles held past
 * a despawn fail lookup instead of reaching whatever reuses the slot.
 *
 * Usage:
 *   ActorHandle handle = actorManager.spawn("player-1");
 *   if (auto actor = actorManager.get(handle)) {
 *       actor->onTick();
 *   }
 */
struct ActorHandle {
  using Index = uint32_t;
  using Generation = uint32_t;

  static constexpr Index INVALID_INDEX = UINT32_MAX;
  static constexpr Generation INVALID_GENERATION = 0;

  Index index{INVALID_INDEX};
  Generation generation{INVALID_GENERATION};

  constexpr ActorHandle() noexcept = default;
  constexpr ActorHandle(Index slot, Generation gen) noexcept
      : index(slot), generation(gen) {}

  [[nodiscard]] constexpr bool isValid() const noexcept {
    return index != INVALID_INDEX && generation != INVALID_GENERATION;
  }

  [[nodiscard]] constexpr Index getIndex() const noexcept { return index; }
  [[nodiscard]] constexpr Generation getGeneration() const noexcept {
    return generation;
  }

  [[nodiscard]] constexpr bool
  operator==(const ActorHandle &other) const noexcept {
    return index == other.index && generation == other.generation;
  }

  [[nodiscard]] constexpr bool
  operator!=(const ActorHandle &other) const noexcept {
    return !(*this == other);
  }

  [[nodiscard]] constexpr bool
  operator<(const ActorHandle &other) const noexcept {
    if (index != other.index) return index < other.index;
    return generation < other.generation;
  }

  [[nodiscard]] std::size_t hash() const noexcept {
    // Pack into 64 bits first; size_t may be 32 bits wide
    const uint64_t packed = (static_cast<uint64_t>(generation) << 32) |
                            static_cast<uint64_t>(index);
    return std::hash<uint64_t>{}(packed);
  }

  // String conversion for debugging
  [[nodiscard]] std::string toString() const {
    if (!isValid()) {
      return "ActorHandle::INVALID";
    }
    return std::format("ActorHandle({}:{})", index, generation);
  }
};

static_assert(sizeof(ActorHandle) == 8, "ActorHandle should be 8 bytes");

inline constexpr ActorHandle INVALID_ACTOR_HANDLE{};

inline std::ostream &operator<<(std::ostream &os, const ActorHandle &handle) {
  return os << handle.toString();
}

} // namespace ColonySim

// Hash function for std::unordered_map support
namespace std {
template <> struct hash<ColonySim::ActorHandle> {
  std::size_t operator()(const ColonySim::ActorHandle &handle) const noexcept {
    return handle.hash();
  }
};
} // namespace std

#endif // ACTOR_HANDLE_HPP
