/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RESOURCE_POOL_HPP
#define RESOURCE_POOL_HPP

#include "entities/ResourceRules.hpp"
#include <array>
#include <atomic>
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

namespace ColonySim {

/**
 * @brief Static parameters of one harvestable location
 */
struct LocationConfig {
  LocationId location{LocationId::Forest};
  ResourceKind yields{ResourceKind::Food};
  int regrowthInterval{15}; // ticks between regrowth events
  int regrowthMin{10};
  int regrowthMax{30};
  int harvestMin{1};
  int harvestMax{5};

  bool isValid() const {
    return RulesTraits::isValidLocation(location) &&
           yields < ResourceKind::COUNT && regrowthInterval > 0 &&
           regrowthMin >= 0 && regrowthMin <= regrowthMax && harvestMin >= 1 &&
           harvestMin <= harvestMax;
  }

  // Reference configuration: forest/food 15, river/water 25, cave/energy 40
  static LocationConfig defaultFor(LocationId location);
};

struct ResourcePoolConfig {
  std::array<LocationConfig, LOCATION_COUNT> locations{
      LocationConfig::defaultFor(LocationId::Forest),
      LocationConfig::defaultFor(LocationId::River),
      LocationConfig::defaultFor(LocationId::Cave)};
  std::optional<uint64_t> seed{}; // unset draws from std::random_device

  bool isValid() const {
    for (size_t i = 0; i < locations.size(); ++i) {
      if (!locations[i].isValid() ||
          locations[i].location != static_cast<LocationId>(i)) {
        return false;
      }
    }
    return true;
  }
};

/**
 * @brief Result of a single harvest
 *
 * An empty result is not an error: the forager simply gains nothing.
 */
struct HarvestResult {
  ResourceKind kind{ResourceKind::Food};
  int amount{0};

  bool empty() const { return amount <= 0; }

  static HarvestResult Empty(ResourceKind kind) { return HarvestResult{kind, 0}; }
};

using LocationAmounts = boost::container::flat_map<LocationId, int>;

struct ResourcePoolStats {
  std::atomic<uint64_t> harvests{0};
  std::atomic<uint64_t> emptyHarvests{0};
  std::atomic<uint64_t> totalHarvested{0};
  std::atomic<uint64_t> regrowthEvents{0};
  std::atomic<uint64_t> regrowthTicks{0};
};

/**
 * @brief Shared store of harvestable location cells
 *
 * Each cell owns its own harvest mutex, so harvests on different locations
 * never contend. Regrowth replaces a cell's amount with a single atomic store
 * and does not take the harvest mutex: a harvest racing a regrowth may see
 * either value, and the regrowth may overwrite the harvest's decrement. That
 * loss is accepted.
 *
 * Cells are created once at construction and never destroyed.
 */
class ResourcePool {
public:
  explicit ResourcePool(const ResourcePoolConfig &config = ResourcePoolConfig{});
  ~ResourcePool() = default;

  ResourcePool(const ResourcePool &) = delete;
  ResourcePool &operator=(const ResourcePool &) = delete;

  /**
   * @brief Take a random bite out of one location
   *
   * taken = min(U[harvestMin, harvestMax], amount); the read-modify-write
   * is indivisible with respect to other harvests on the same cell.
   */
  HarvestResult harvest(LocationId location);

  /**
   * @brief Advance every location's regrowth countdown by one tick
   *
   * A location whose countdown reaches its interval has its amount replaced
   * (not topped up) by U[regrowthMin, regrowthMax].
   */
  void regrowthTick();

  // Diagnostic snapshot; values may be mid-update relative to each other
  LocationAmounts getLocations() const;
  int getAmount(LocationId location) const;

  // Diagnostic override, negative values clamp to zero
  void setAmount(LocationId location, int amount);

  int getRegrowthCountdown(LocationId location) const;
  const LocationConfig &getLocationConfig(LocationId location) const;

  uint64_t getHarvestCount() const { return m_stats.harvests.load(); }
  uint64_t getEmptyHarvestCount() const { return m_stats.emptyHarvests.load(); }
  uint64_t getTotalHarvested() const { return m_stats.totalHarvested.load(); }
  uint64_t getRegrowthEventCount() const {
    return m_stats.regrowthEvents.load();
  }
  uint64_t getRegrowthTickCount() const { return m_stats.regrowthTicks.load(); }

private:
  // One cache line per cell so neighbouring harvests don't false-share
  struct alignas(64) Cell {
    LocationConfig config{};
    std::atomic<int> amount{0};
    std::atomic<int> regrowthCountdown{0};
    std::mutex harvestMutex{};
    std::mt19937 harvestRng{}; // guarded by harvestMutex
  };

  std::array<Cell, LOCATION_COUNT> m_cells{};

  // Serializes regrowth ticks against each other only
  std::mutex m_regrowthMutex{};
  std::mt19937 m_regrowthRng{}; // guarded by m_regrowthMutex

  ResourcePoolStats m_stats{};

  Cell *cellFor(LocationId location);
  const Cell *cellFor(LocationId location) const;
};

} // namespace ColonySim

#endif // RESOURCE_POOL_HPP
