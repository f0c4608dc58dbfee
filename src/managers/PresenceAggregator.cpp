/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/PresenceAggregator.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace ColonySim {

PresenceAggregator::PresenceAggregator(std::optional<uint64_t> seed)
    : m_rng(seed ? *seed : std::random_device{}()) {}

PresencePosition PresenceAggregator::drawPosition() {
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  const double x = POSITION_MIN + dist(m_rng) * POSITION_SPAN;
  const double y = POSITION_MIN + dist(m_rng) * POSITION_SPAN;
  return PresencePosition{x, y};
}

PresenceSummary PresenceAggregator::buildSummaryLocked() const {
  PresenceSummary summary;
  summary.version = m_version;
  summary.totalCount = m_counters.totalCount;
  summary.idleCount = m_counters.idleCount;
  summary.foragingCount = m_counters.foragingCount;
  summary.entries.reserve(m_records.size());
  for (const auto &[id, record] : m_records) {
    summary.entries.push_back(PresenceEntry{record.position, record.activity});
  }
  // Hash order could leak information about ids; sort on the position instead
  std::sort(summary.entries.begin(), summary.entries.end(),
            [](const PresenceEntry &a, const PresenceEntry &b) {
              if (a.position.x != b.position.x) {
                return a.position.x < b.position.x;
              }
              return a.position.y < b.position.y;
            });
  return summary;
}

bool PresenceAggregator::registerActor(const std::string &actorId) {
  PresenceSummary summary;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_records.contains(actorId)) {
      return false;
    }
    m_records.emplace(actorId, PresenceRecord{drawPosition(), Activity::Idle});
    ++m_counters.totalCount;
    ++m_counters.idleCount;
    ++m_version;
    summary = buildSummaryLocked();
  }

  PRESENCE_DEBUG(std::format("Actor registered, total {}", summary.totalCount));
  notifyListeners(summary);
  return true;
}

bool PresenceAggregator::unregisterActor(const std::string &actorId) {
  PresenceSummary summary;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(actorId);
    if (it == m_records.end()) {
      return false;
    }
    const Activity last = it->second.activity;
    m_records.erase(it);

    if (m_counters.totalCount > 0) {
      --m_counters.totalCount;
    }
    size_t &bucket = (last == Activity::Foraging) ? m_counters.foragingCount
                                                  : m_counters.idleCount;
    if (bucket > 0) {
      --bucket;
    }
    ++m_version;
    summary = buildSummaryLocked();
  }

  PRESENCE_DEBUG(
      std::format("Actor unregistered, total {}", summary.totalCount));
  notifyListeners(summary);
  return true;
}

bool PresenceAggregator::updateActivity(const std::string &actorId,
                                        Activity activity) {
  PresenceSummary summary;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(actorId);
    if (it == m_records.end() || it->second.activity == activity) {
      return false;
    }

    size_t &from = (it->second.activity == Activity::Foraging)
                       ? m_counters.foragingCount
                       : m_counters.idleCount;
    size_t &to = (activity == Activity::Foraging) ? m_counters.foragingCount
                                                  : m_counters.idleCount;
    if (from > 0) {
      --from;
    }
    ++to;
    it->second.activity = activity;
    ++m_version;
    summary = buildSummaryLocked();
  }

  notifyListeners(summary);
  return true;
}

PresenceSummary PresenceAggregator::getSummary() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return buildSummaryLocked();
}

PresenceCounters PresenceAggregator::getCounters() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_counters;
}

PresenceCounters PresenceAggregator::recountLocked() const {
  PresenceCounters counters;
  counters.totalCount = m_records.size();
  for (const auto &[id, record] : m_records) {
    if (record.activity == Activity::Foraging) {
      ++counters.foragingCount;
    } else {
      ++counters.idleCount;
    }
  }
  return counters;
}

PresenceCounters PresenceAggregator::recount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return recountLocked();
}

bool PresenceAggregator::isConsistent() const {
  PresenceCounters incremental;
  PresenceCounters scanned;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    incremental = m_counters;
    scanned = recountLocked();
  }
  if (incremental != scanned) {
    PRESENCE_ERROR(std::format(
        "Counter drift: incremental {}/{}/{} vs scan {}/{}/{}",
        incremental.totalCount, incremental.idleCount,
        incremental.foragingCount, scanned.totalCount, scanned.idleCount,
        scanned.foragingCount));
    return false;
  }
  return incremental.totalCount ==
         incremental.idleCount + incremental.foragingCount;
}

bool PresenceAggregator::contains(const std::string &actorId) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_records.contains(actorId);
}

std::optional<Activity>
PresenceAggregator::getActivity(const std::string &actorId) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_records.find(actorId);
  if (it == m_records.end()) {
    return std::nullopt;
  }
  return it->second.activity;
}

uint64_t PresenceAggregator::getVersion() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_version;
}

PresenceAggregator::ListenerId
PresenceAggregator::registerListener(SummaryListener listener) {
  std::lock_guard<std::mutex> lock(m_listenerMutex);
  const ListenerId id = m_nextListenerId++;
  m_listeners.emplace_back(id, std::move(listener));
  return id;
}

bool PresenceAggregator::unregisterListener(ListenerId id) {
  std::lock_guard<std::mutex> lock(m_listenerMutex);
  auto it = std::find_if(m_listeners.begin(), m_listeners.end(),
                         [id](const auto &entry) { return entry.first == id; });
  if (it == m_listeners.end()) {
    return false;
  }
  m_listeners.erase(it);
  return true;
}

void PresenceAggregator::notifyListeners(const PresenceSummary &summary) {
  // Copy so listeners run without holding any lock
  std::vector<SummaryListener> listeners;
  {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    listeners.reserve(m_listeners.size());
    for (const auto &[id, listener] : m_listeners) {
      listeners.push_back(listener);
    }
  }

  for (const auto &listener : listeners) {
    try {
      listener(summary);
    } catch (const std::exception &e) {
      PRESENCE_ERROR(std::format("Presence listener threw: {}", e.what()));
    }
  }
}

} // namespace ColonySim
