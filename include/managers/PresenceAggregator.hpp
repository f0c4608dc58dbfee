/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PRESENCE_AGGREGATOR_HPP
#define PRESENCE_AGGREGATOR_HPP

#include "entities/ResourceRules.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace ColonySim {

/**
 * @brief Anonymized position in [0.15, 0.85] on both axes
 */
struct PresencePosition {
  double x{0.5};
  double y{0.5};

  bool operator==(const PresencePosition &) const = default;
};

struct PresenceEntry {
  PresencePosition position{};
  Activity activity{Activity::Idle};
};

struct PresenceCounters {
  size_t totalCount{0};
  size_t idleCount{0};
  size_t foragingCount{0};

  bool operator==(const PresenceCounters &) const = default;
};

/**
 * @brief Aggregate view handed to observers
 *
 * Carries no actor identifier in any field. Entries are ordered by position,
 * never by registration order or id.
 */
struct PresenceSummary {
  uint64_t version{0}; // strictly increasing per emitted change
  size_t totalCount{0};
  size_t idleCount{0};
  size_t foragingCount{0};
  std::vector<PresenceEntry> entries{};

  PresenceCounters counters() const {
    return PresenceCounters{totalCount, idleCount, foragingCount};
  }
};

/**
 * @brief Anonymized presence map with incrementally maintained counters
 *
 * All writes are serialized under one mutex. Counters are adjusted by the
 * transition delta of each write and never rebuilt by scanning; recount()
 * performs the full scan so callers can check the two agree.
 *
 * Listeners are invoked after the lock is released. Two writers finishing
 * close together may deliver their summaries out of order; consumers should
 * discard a summary whose version is not newer than the last one seen.
 */
class PresenceAggregator {
public:
  using SummaryListener = std::function<void(const PresenceSummary &)>;
  using ListenerId = uint64_t;

  static constexpr double POSITION_MIN = 0.15;
  static constexpr double POSITION_SPAN = 0.70;

  explicit PresenceAggregator(std::optional<uint64_t> seed = std::nullopt);
  ~PresenceAggregator() = default;

  PresenceAggregator(const PresenceAggregator &) = delete;
  PresenceAggregator &operator=(const PresenceAggregator &) = delete;

  /**
   * @brief Add an actor as Idle at a fresh random position
   * @return true if the actor was added, false if it was already present
   * (still a success, nothing changes and nothing is emitted)
   */
  bool registerActor(const std::string &actorId);

  /**
   * @return true if a record was removed
   */
  bool unregisterActor(const std::string &actorId);

  /**
   * @return true if the activity changed; unknown ids and same-activity
   * updates are silent no-ops
   */
  bool updateActivity(const std::string &actorId, Activity activity);

  PresenceSummary getSummary() const;
  PresenceCounters getCounters() const;

  // Full-scan recomputation of the counters
  PresenceCounters recount() const;
  bool isConsistent() const;

  bool contains(const std::string &actorId) const;
  std::optional<Activity> getActivity(const std::string &actorId) const;
  uint64_t getVersion() const;

  ListenerId registerListener(SummaryListener listener);
  bool unregisterListener(ListenerId id);

private:
  struct PresenceRecord {
    PresencePosition position{};
    Activity activity{Activity::Idle};
  };

  mutable std::mutex m_mutex{};
  std::unordered_map<std::string, PresenceRecord> m_records{};
  PresenceCounters m_counters{};
  uint64_t m_version{0};
  std::mt19937_64 m_rng; // guarded by m_mutex

  mutable std::mutex m_listenerMutex{};
  std::vector<std::pair<ListenerId, SummaryListener>> m_listeners{};
  ListenerId m_nextListenerId{1};

  // Callers hold m_mutex
  PresencePosition drawPosition();
  PresenceSummary buildSummaryLocked() const;
  PresenceCounters recountLocked() const;

  void notifyListeners(const PresenceSummary &summary);
};

} // namespace ColonySim

#endif // PRESENCE_AGGREGATOR_HPP
