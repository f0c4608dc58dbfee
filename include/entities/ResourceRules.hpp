/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RESOURCE_RULES_HPP
#define RESOURCE_RULES_HPP

#include <array>
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ColonySim {

/**
 * @brief Resources every actor carries, indexed by kind
 */
enum class ResourceKind : uint8_t { Food = 0, Water = 1, Energy = 2, COUNT };

/**
 * @brief Closed set of inventory item kinds
 */
enum class ItemKind : uint8_t {
  Wood = 0,
  Stone = 1,
  Fiber = 2,
  Berries = 3,
  COUNT
};

/**
 * @brief Closed set of harvestable locations
 */
enum class LocationId : uint8_t { Forest = 0, River = 1, Cave = 2, COUNT };

/**
 * @brief Coarse activity class, the only per-actor state presence exposes
 */
enum class Activity : uint8_t { Idle = 0, Foraging = 1 };

/**
 * @brief Outcome of a rules operation
 *
 * Every non-Success value leaves the record untouched.
 */
enum class RulesResult {
  Success,
  AlreadyForaging,
  InvalidLocation,
  InsufficientItems
};

constexpr size_t RESOURCE_KIND_COUNT = static_cast<size_t>(ResourceKind::COUNT);
constexpr size_t LOCATION_COUNT = static_cast<size_t>(LocationId::COUNT);

namespace RulesTraits {

constexpr const char *resourceKindToString(ResourceKind kind) noexcept {
  switch (kind) {
  case ResourceKind::Food:   return "food";
  case ResourceKind::Water:  return "water";
  case ResourceKind::Energy: return "energy";
  default:                   return "unknown";
  }
}

constexpr const char *itemKindToString(ItemKind kind) noexcept {
  switch (kind) {
  case ItemKind::Wood:    return "wood";
  case ItemKind::Stone:   return "stone";
  case ItemKind::Fiber:   return "fiber";
  case ItemKind::Berries: return "berries";
  default:                return "unknown";
  }
}

constexpr const char *locationToString(LocationId location) noexcept {
  switch (location) {
  case LocationId::Forest: return "forest";
  case LocationId::River:  return "river";
  case LocationId::Cave:   return "cave";
  default:                 return "unknown";
  }
}

constexpr const char *activityToString(Activity activity) noexcept {
  return activity == Activity::Foraging ? "foraging" : "idle";
}

constexpr const char *resultToString(RulesResult result) noexcept {
  switch (result) {
  case RulesResult::Success:           return "Success";
  case RulesResult::AlreadyForaging:   return "AlreadyForaging";
  case RulesResult::InvalidLocation:   return "InvalidLocation";
  case RulesResult::InsufficientItems: return "InsufficientItems";
  default:                             return "Unknown";
  }
}

constexpr bool isValidLocation(LocationId location) noexcept {
  return location < LocationId::COUNT;
}

// Exact, case-sensitive match on the lowercase location key
std::optional<LocationId> parseLocation(std::string_view key);
std::optional<ItemKind> parseItemKind(std::string_view key);

} // namespace RulesTraits

/**
 * @brief Fixed-key resource ledger. Values never go below zero.
 */
struct Resources {
  int food{100};
  int water{100};
  int energy{100};

  int get(ResourceKind kind) const {
    switch (kind) {
    case ResourceKind::Food:   return food;
    case ResourceKind::Water:  return water;
    case ResourceKind::Energy: return energy;
    default:                   return 0;
    }
  }

  int &at(ResourceKind kind);

  bool operator==(const Resources &other) const = default;
};

struct IdleState {
  bool operator==(const IdleState &) const = default;
};

struct ForagingState {
  LocationId location{LocationId::Forest};
  int remainingTicks{0}; // always > 0 while in this state

  bool operator==(const ForagingState &) const = default;
};

using ActorState = std::variant<IdleState, ForagingState>;

// Lazily opened per kind; a missing key counts as zero
using Inventory = boost::container::flat_map<ItemKind, int>;
using ResourceDeltas = boost::container::flat_map<ResourceKind, int>;

/**
 * @brief The full ledger owned by one actor
 */
struct ActorRecord {
  std::string id;
  ActorState state{IdleState{}};
  Resources resources{};
  Inventory inventory{};
  uint64_t tickCounter{0};
  int64_t lastUpdated{0}; // seconds since epoch, refreshed on every mutation

  bool isIdle() const { return std::holds_alternative<IdleState>(state); }
  bool isForaging() const {
    return std::holds_alternative<ForagingState>(state);
  }
  Activity activity() const {
    return isForaging() ? Activity::Foraging : Activity::Idle;
  }
  std::optional<LocationId> foragingLocation() const {
    if (const auto *foraging = std::get_if<ForagingState>(&state)) {
      return foraging->location;
    }
    return std::nullopt;
  }
  int remainingTicks() const {
    const auto *foraging = std::get_if<ForagingState>(&state);
    return foraging ? foraging->remainingTicks : 0;
  }
  int itemCount(ItemKind kind) const {
    auto it = inventory.find(kind);
    return it != inventory.end() ? it->second : 0;
  }
};

/**
 * @brief Pure state machine and ledger rules for one actor
 *
 * Free functions over a caller-owned ActorRecord. No I/O, no locking; the
 * owning Actor provides single-writer access.
 */
namespace ResourceRules {

constexpr int INITIAL_RESOURCE_AMOUNT = 100;
constexpr int FORAGING_DURATION_TICKS = 5;
constexpr LocationId DEFAULT_FORAGING_LOCATION = LocationId::Forest;

struct ConsumptionRule {
  ResourceKind kind;
  uint64_t intervalTicks;
  int rate;
};

// Evaluated independently every tick; each rule touches a disjoint field
inline constexpr std::array<ConsumptionRule, RESOURCE_KIND_COUNT>
    CONSUMPTION_SCHEDULE{{{ResourceKind::Food, 5, 1},
                          {ResourceKind::Water, 10, 1},
                          {ResourceKind::Energy, 15, 1}}};

ActorRecord newRecord(std::string id);

RulesResult beginForaging(ActorRecord &record, LocationId location);
RulesResult beginForaging(ActorRecord &record, std::string_view locationKey);
// Location-less command, goes to DEFAULT_FORAGING_LOCATION
RulesResult beginForaging(ActorRecord &record);

/**
 * @brief Advance the record by one tick
 *
 * Increments the tick counter, applies the consumption schedule and counts
 * down an active foraging episode.
 *
 * @return The location of a foraging episode that completed on this tick
 * (the Foraging to Idle edge), std::nullopt otherwise
 */
std::optional<LocationId> processTick(ActorRecord &record);

// Any magnitude; each result is clamped at zero. Never fails.
void updateResources(ActorRecord &record, const ResourceDeltas &deltas);
void updateResource(ActorRecord &record, ResourceKind kind, int delta);

// Non-positive amounts are ignored
void addItem(ActorRecord &record, ItemKind kind, int amount);
void addItems(ActorRecord &record, const Inventory &items);

// Non-positive amounts succeed without touching the record
RulesResult removeItem(ActorRecord &record, ItemKind kind, int amount);

bool hasItem(const ActorRecord &record, ItemKind kind, int amount = 1);

} // namespace ResourceRules

} // namespace ColonySim

#endif // RESOURCE_RULES_HPP
