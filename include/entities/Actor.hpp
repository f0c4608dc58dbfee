/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTOR_HPP
#define ACTOR_HPP

#include "entities/ResourceRules.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ColonySim {

class ResourcePool;
class PresenceAggregator;

using ActorId = std::string;

/**
 * @brief Read-only copy of an actor's ledger
 */
struct ActorSnapshot {
  ActorId id{};
  Resources resources{};
  Inventory inventory{};
  Activity status{Activity::Idle};
  uint64_t tickCounter{0};
  std::optional<LocationId> foragingLocation{};
  int remainingTicks{0};
  int64_t lastUpdated{0};

  static ActorSnapshot fromRecord(const ActorRecord &record);
};

/**
 * @brief Outcome of a command sent to an actor
 *
 * Mirrors RulesResult plus ActorUnavailable for actors that have been
 * stopped before the command ran.
 */
enum class CommandStatus {
  Success,
  AlreadyForaging,
  InvalidLocation,
  InsufficientItems,
  ActorUnavailable
};

constexpr const char *commandStatusToString(CommandStatus status) noexcept {
  switch (status) {
  case CommandStatus::Success:           return "Success";
  case CommandStatus::AlreadyForaging:   return "AlreadyForaging";
  case CommandStatus::InvalidLocation:   return "InvalidLocation";
  case CommandStatus::InsufficientItems: return "InsufficientItems";
  case CommandStatus::ActorUnavailable:  return "ActorUnavailable";
  default:                               return "Unknown";
  }
}

struct CommandResult {
  CommandStatus status{CommandStatus::ActorUnavailable};
  // State after the command; holds the unchanged state on a rules rejection
  // and nothing when the actor was unavailable
  std::optional<ActorSnapshot> snapshot{};

  bool succeeded() const { return status == CommandStatus::Success; }
};

// Commands accepted by Actor::submitCommand
struct BeginForaging {
  // Location key ("forest", "river", "cave"); unset means the default location
  std::optional<std::string> location{};
};

struct AddItem {
  ItemKind kind{ItemKind::Wood};
  int amount{0};
};

struct RemoveItem {
  ItemKind kind{ItemKind::Wood};
  int amount{0};
};

using ActorCommand = std::variant<BeginForaging, AddItem, RemoveItem>;

/**
 * @brief Single-writer owner of one ActorRecord
 *
 * Every tick and command is posted to a FIFO mailbox. The mailbox is drained
 * by at most one ThreadSystem worker at a time, so all mutation of the record
 * is totally ordered and never concurrent. If the ThreadSystem is not
 * running, the posting thread drains the mailbox itself.
 *
 * onTick() never blocks. submitCommand() and getState() post a message and
 * wait for it, so they must not be called from an observer callback or from
 * a worker thread that the mailbox depends on.
 *
 * Actors must be owned by a std::shared_ptr (see create()).
 */
class Actor : public std::enable_shared_from_this<Actor> {
public:
  using SnapshotObserver = std::function<void(const ActorSnapshot &)>;
  using ObserverId = uint64_t;

  static std::shared_ptr<Actor> create(ActorId id, ResourcePool &pool,
                                       PresenceAggregator &presence);

  Actor(ActorId id, ResourcePool &pool, PresenceAggregator &presence);
  ~Actor();

  Actor(const Actor &) = delete;
  Actor &operator=(const Actor &) = delete;

  /**
   * @brief Post a tick to the mailbox
   * @return false if the actor is stopped and the tick was dropped
   */
  bool onTick();

  /**
   * @brief Run a command through the mailbox and wait for its outcome
   */
  CommandResult submitCommand(const ActorCommand &command);

  // Convenience wrappers over submitCommand
  CommandResult beginForaging(const std::string &location);
  CommandResult beginForaging();
  CommandResult addItem(ItemKind kind, int amount);
  CommandResult removeItem(ItemKind kind, int amount);

  /**
   * @brief Snapshot taken in mailbox order, after all earlier messages
   * @return std::nullopt once the actor is stopped
   */
  std::optional<ActorSnapshot> getState();

  /**
   * @brief Stop accepting messages
   *
   * Queued ticks are dropped and callers waiting on queued commands receive
   * ActorUnavailable. A message already being processed runs to completion,
   * but once stop() returns it no longer reaches the presence aggregator.
   * Must not be called from a presence listener.
   */
  void stop();
  bool isStopped() const;

  // Observers get the latest snapshot after every processed tick or command
  ObserverId addObserver(SnapshotObserver observer);
  bool removeObserver(ObserverId id);

  const ActorId &getId() const { return m_id; }
  size_t getPendingMessageCount() const;
  uint64_t getProcessedMessageCount() const {
    return m_processedMessages.load(std::memory_order_relaxed);
  }

  // Messages handled per drain task before yielding the worker
  static constexpr size_t MAX_MESSAGES_PER_DRAIN = 32;

private:
  struct Message {
    std::function<void()> process;
    std::function<void()> reject; // may be empty
    bool highPriority{false};
  };

  const ActorId m_id;
  ResourcePool &m_pool;
  PresenceAggregator &m_presence;

  // Touched only by the thread currently draining the mailbox
  ActorRecord m_record;

  mutable std::mutex m_mailboxMutex{};
  std::deque<Message> m_mailbox{};
  bool m_draining{false};
  bool m_stopped{false};

  mutable std::mutex m_observerMutex{};
  std::vector<std::pair<ObserverId, SnapshotObserver>> m_observers{};
  ObserverId m_nextObserverId{1};

  std::atomic<uint64_t> m_processedMessages{0};

  // Held across each presence update so stop() can fence them off
  std::mutex m_presenceGateMutex{};

  bool post(Message message);
  void scheduleDrain(bool highPriority);
  void drain();

  // Message bodies, run on the draining thread
  void handleTick();
  CommandResult handleCommand(const ActorCommand &command);
  void reportActivity(Activity activity);

  void publish(const ActorSnapshot &snapshot);
};

} // namespace ColonySim

#endif // ACTOR_HPP
