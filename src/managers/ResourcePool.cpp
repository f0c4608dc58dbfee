/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ResourcePool.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace ColonySim {

LocationConfig LocationConfig::defaultFor(LocationId location) {
  switch (location) {
  case LocationId::River:
    return LocationConfig{LocationId::River, ResourceKind::Water, 25, 10, 30, 1,
                          5};
  case LocationId::Cave:
    return LocationConfig{LocationId::Cave, ResourceKind::Energy, 40, 10, 30, 1,
                          5};
  case LocationId::Forest:
  default:
    return LocationConfig{LocationId::Forest, ResourceKind::Food, 15, 10, 30, 1,
                          5};
  }
}

ResourcePool::ResourcePool(const ResourcePoolConfig &config) {
  ResourcePoolConfig effective = config;
  if (!config.isValid()) {
    POOL_ERROR("Invalid pool configuration, using reference locations");
    effective = ResourcePoolConfig{};
    effective.seed = config.seed;
  }

  const uint64_t seed =
      effective.seed ? *effective.seed : std::random_device{}();
  std::seed_seq regrowthSeq{static_cast<uint32_t>(seed),
                            static_cast<uint32_t>(seed >> 32), 0xC0FFEEu};
  m_regrowthRng.seed(regrowthSeq);

  for (size_t i = 0; i < m_cells.size(); ++i) {
    Cell &cell = m_cells[i];
    cell.config = effective.locations[i];

    std::seed_seq cellSeq{static_cast<uint32_t>(seed),
                          static_cast<uint32_t>(seed >> 32),
                          static_cast<uint32_t>(i + 1)};
    cell.harvestRng.seed(cellSeq);

    // Initial stock is a regrowth draw
    std::uniform_int_distribution<int> dist(cell.config.regrowthMin,
                                            cell.config.regrowthMax);
    cell.amount.store(dist(m_regrowthRng), std::memory_order_relaxed);
    cell.regrowthCountdown.store(0, std::memory_order_relaxed);

    POOL_DEBUG(std::format("Location {} seeded with {} {}",
                           RulesTraits::locationToString(cell.config.location),
                           cell.amount.load(std::memory_order_relaxed),
                           RulesTraits::resourceKindToString(cell.config.yields)));
  }
}

ResourcePool::Cell *ResourcePool::cellFor(LocationId location) {
  if (!RulesTraits::isValidLocation(location)) {
    return nullptr;
  }
  return &m_cells[static_cast<size_t>(location)];
}

const ResourcePool::Cell *ResourcePool::cellFor(LocationId location) const {
  if (!RulesTraits::isValidLocation(location)) {
    return nullptr;
  }
  return &m_cells[static_cast<size_t>(location)];
}

HarvestResult ResourcePool::harvest(LocationId location) {
  Cell *cell = cellFor(location);
  if (!cell) {
    POOL_WARN(std::format("Harvest requested for unknown location {}",
                          static_cast<int>(location)));
    return HarvestResult::Empty(ResourceKind::Food);
  }

  m_stats.harvests.fetch_add(1, std::memory_order_relaxed);

  int taken = 0;
  {
    std::lock_guard<std::mutex> lock(cell->harvestMutex);
    const int current = cell->amount.load(std::memory_order_acquire);
    if (current > 0) {
      std::uniform_int_distribution<int> dist(cell->config.harvestMin,
                                              cell->config.harvestMax);
      taken = std::min(dist(cell->harvestRng), current);
      cell->amount.store(current - taken, std::memory_order_release);
    }
  }

  if (taken == 0) {
    m_stats.emptyHarvests.fetch_add(1, std::memory_order_relaxed);
    return HarvestResult::Empty(cell->config.yields);
  }

  m_stats.totalHarvested.fetch_add(static_cast<uint64_t>(taken),
                                   std::memory_order_relaxed);
  return HarvestResult{cell->config.yields, taken};
}

void ResourcePool::regrowthTick() {
  std::lock_guard<std::mutex> lock(m_regrowthMutex);
  m_stats.regrowthTicks.fetch_add(1, std::memory_order_relaxed);

  for (auto &cell : m_cells) {
    const int countdown =
        cell.regrowthCountdown.load(std::memory_order_relaxed) + 1;
    if (countdown < cell.config.regrowthInterval) {
      cell.regrowthCountdown.store(countdown, std::memory_order_relaxed);
      continue;
    }

    std::uniform_int_distribution<int> dist(cell.config.regrowthMin,
                                            cell.config.regrowthMax);
    const int fresh = dist(m_regrowthRng);
    // Unconditional replacement; deliberately not under harvestMutex
    cell.amount.store(fresh, std::memory_order_release);
    cell.regrowthCountdown.store(0, std::memory_order_relaxed);
    m_stats.regrowthEvents.fetch_add(1, std::memory_order_relaxed);

    POOL_DEBUG(std::format("Location {} regrew to {}",
                           RulesTraits::locationToString(cell.config.location),
                           fresh));
  }
}

LocationAmounts ResourcePool::getLocations() const {
  LocationAmounts amounts;
  amounts.reserve(m_cells.size());
  for (const auto &cell : m_cells) {
    amounts.emplace(cell.config.location,
                    cell.amount.load(std::memory_order_acquire));
  }
  return amounts;
}

int ResourcePool::getAmount(LocationId location) const {
  const Cell *cell = cellFor(location);
  return cell ? cell->amount.load(std::memory_order_acquire) : 0;
}

void ResourcePool::setAmount(LocationId location, int amount) {
  Cell *cell = cellFor(location);
  if (!cell) {
    POOL_WARN(std::format("setAmount ignored for unknown location {}",
                          static_cast<int>(location)));
    return;
  }
  std::lock_guard<std::mutex> lock(cell->harvestMutex);
  cell->amount.store(std::max(amount, 0), std::memory_order_release);
}

int ResourcePool::getRegrowthCountdown(LocationId location) const {
  const Cell *cell = cellFor(location);
  return cell ? cell->regrowthCountdown.load(std::memory_order_relaxed) : 0;
}

const LocationConfig &ResourcePool::getLocationConfig(LocationId location) const {
  const Cell *cell = cellFor(location);
  // Out-of-range ids map to the first cell rather than reading past the array
  return cell ? cell->config : m_cells.front().config;
}

} // namespace ColonySim
