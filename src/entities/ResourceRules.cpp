/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/ResourceRules.hpp"
#include <algorithm>
#include <chrono>
#include <limits>

namespace ColonySim {

namespace RulesTraits {

std::optional<LocationId> parseLocation(std::string_view key) {
  for (size_t i = 0; i < LOCATION_COUNT; ++i) {
    const auto location = static_cast<LocationId>(i);
    if (key == locationToString(location)) {
      return location;
    }
  }
  return std::nullopt;
}

std::optional<ItemKind> parseItemKind(std::string_view key) {
  for (size_t i = 0; i < static_cast<size_t>(ItemKind::COUNT); ++i) {
    const auto kind = static_cast<ItemKind>(i);
    if (key == itemKindToString(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

} // namespace RulesTraits

int &Resources::at(ResourceKind kind) {
  switch (kind) {
  case ResourceKind::Water:
    return water;
  case ResourceKind::Energy:
    return energy;
  case ResourceKind::Food:
  default:
    return food;
  }
}

namespace ResourceRules {

namespace {

int64_t nowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void touch(ActorRecord &record) { record.lastUpdated = nowSeconds(); }

// Saturating add, floor at zero
int clampedSum(int current, int delta) {
  const int64_t sum = static_cast<int64_t>(current) + delta;
  return static_cast<int>(std::clamp<int64_t>(
      sum, 0, std::numeric_limits<int>::max()));
}

bool isValidItemKind(ItemKind kind) { return kind < ItemKind::COUNT; }

bool isValidResourceKind(ResourceKind kind) {
  return kind < ResourceKind::COUNT;
}

} // anonymous namespace

ActorRecord newRecord(std::string id) {
  ActorRecord record;
  record.id = std::move(id);
  record.state = IdleState{};
  record.resources = Resources{INITIAL_RESOURCE_AMOUNT, INITIAL_RESOURCE_AMOUNT,
                               INITIAL_RESOURCE_AMOUNT};
  record.tickCounter = 0;
  touch(record);
  return record;
}

RulesResult beginForaging(ActorRecord &record, LocationId location) {
  // Already foraging wins over a bad location
  if (record.isForaging()) {
    return RulesResult::AlreadyForaging;
  }
  if (!RulesTraits::isValidLocation(location)) {
    return RulesResult::InvalidLocation;
  }

  record.state = ForagingState{location, FORAGING_DURATION_TICKS};
  touch(record);
  return RulesResult::Success;
}

RulesResult beginForaging(ActorRecord &record, std::string_view locationKey) {
  if (record.isForaging()) {
    return RulesResult::AlreadyForaging;
  }
  auto location = RulesTraits::parseLocation(locationKey);
  if (!location) {
    return RulesResult::InvalidLocation;
  }
  return beginForaging(record, *location);
}

RulesResult beginForaging(ActorRecord &record) {
  return beginForaging(record, DEFAULT_FORAGING_LOCATION);
}

std::optional<LocationId> processTick(ActorRecord &record) {
  ++record.tickCounter;

  for (const auto &rule : CONSUMPTION_SCHEDULE) {
    if (record.tickCounter % rule.intervalTicks == 0) {
      int &value = record.resources.at(rule.kind);
      value = clampedSum(value, -rule.rate);
    }
  }

  std::optional<LocationId> completed;
  if (auto *foraging = std::get_if<ForagingState>(&record.state)) {
    --foraging->remainingTicks;
    if (foraging->remainingTicks <= 0) {
      completed = foraging->location;
      record.state = IdleState{};
    }
  }

  touch(record);
  return completed;
}

void updateResource(ActorRecord &record, ResourceKind kind, int delta) {
  if (!isValidResourceKind(kind) || delta == 0) {
    return;
  }
  int &value = record.resources.at(kind);
  value = clampedSum(value, delta);
  touch(record);
}

void updateResources(ActorRecord &record, const ResourceDeltas &deltas) {
  for (const auto &[kind, delta] : deltas) {
    updateResource(record, kind, delta);
  }
}

void addItem(ActorRecord &record, ItemKind kind, int amount) {
  if (amount <= 0 || !isValidItemKind(kind)) {
    return;
  }
  int &count = record.inventory[kind];
  count = clampedSum(count, amount);
  touch(record);
}

void addItems(ActorRecord &record, const Inventory &items) {
  for (const auto &[kind, amount] : items) {
    addItem(record, kind, amount);
  }
}

RulesResult removeItem(ActorRecord &record, ItemKind kind, int amount) {
  if (amount <= 0) {
    return RulesResult::Success;
  }
  auto it = record.inventory.find(kind);
  if (it == record.inventory.end() || it->second < amount) {
    return RulesResult::InsufficientItems;
  }
  it->second -= amount;
  touch(record);
  return RulesResult::Success;
}

bool hasItem(const ActorRecord &record, ItemKind kind, int amount) {
  return record.itemCount(kind) >= amount;
}

} // namespace ResourceRules

} // namespace ColonySim
