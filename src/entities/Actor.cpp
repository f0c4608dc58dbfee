/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Actor.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/PresenceAggregator.hpp"
#include "managers/ResourcePool.hpp"
#include <algorithm>
#include <format>
#include <future>

namespace ColonySim {

namespace {

CommandStatus toCommandStatus(RulesResult result) {
  switch (result) {
  case RulesResult::Success:
    return CommandStatus::Success;
  case RulesResult::AlreadyForaging:
    return CommandStatus::AlreadyForaging;
  case RulesResult::InvalidLocation:
    return CommandStatus::InvalidLocation;
  case RulesResult::InsufficientItems:
    return CommandStatus::InsufficientItems;
  default:
    return CommandStatus::ActorUnavailable;
  }
}

} // anonymous namespace

ActorSnapshot ActorSnapshot::fromRecord(const ActorRecord &record) {
  ActorSnapshot snapshot;
  snapshot.id = record.id;
  snapshot.resources = record.resources;
  snapshot.inventory = record.inventory;
  snapshot.status = record.activity();
  snapshot.tickCounter = record.tickCounter;
  snapshot.foragingLocation = record.foragingLocation();
  snapshot.remainingTicks = record.remainingTicks();
  snapshot.lastUpdated = record.lastUpdated;
  return snapshot;
}

std::shared_ptr<Actor> Actor::create(ActorId id, ResourcePool &pool,
                                     PresenceAggregator &presence) {
  return std::make_shared<Actor>(std::move(id), pool, presence);
}

Actor::Actor(ActorId id, ResourcePool &pool, PresenceAggregator &presence)
    : m_id(std::move(id)), m_pool(pool), m_presence(presence),
      m_record(ResourceRules::newRecord(m_id)) {}

Actor::~Actor() { stop(); }

bool Actor::onTick() {
  return post(Message{[this]() { handleTick(); }, nullptr, false});
}

CommandResult Actor::submitCommand(const ActorCommand &command) {
  auto promise = std::make_shared<std::promise<CommandResult>>();
  auto future = promise->get_future();

  Message message{
      [this, promise, command]() { promise->set_value(handleCommand(command)); },
      [promise]() {
        promise->set_value(CommandResult{CommandStatus::ActorUnavailable, {}});
      },
      true};

  if (!post(std::move(message))) {
    return CommandResult{CommandStatus::ActorUnavailable, {}};
  }
  return future.get();
}

CommandResult Actor::beginForaging(const std::string &location) {
  return submitCommand(BeginForaging{location});
}

CommandResult Actor::beginForaging() { return submitCommand(BeginForaging{}); }

CommandResult Actor::addItem(ItemKind kind, int amount) {
  return submitCommand(AddItem{kind, amount});
}

CommandResult Actor::removeItem(ItemKind kind, int amount) {
  return submitCommand(RemoveItem{kind, amount});
}

std::optional<ActorSnapshot> Actor::getState() {
  auto promise = std::make_shared<std::promise<std::optional<ActorSnapshot>>>();
  auto future = promise->get_future();

  Message message{
      [this, promise]() {
        promise->set_value(ActorSnapshot::fromRecord(m_record));
      },
      [promise]() { promise->set_value(std::nullopt); }, true};

  if (!post(std::move(message))) {
    return std::nullopt;
  }
  return future.get();
}

void Actor::stop() {
  std::deque<Message> pending;
  {
    std::lock_guard<std::mutex> lock(m_mailboxMutex);
    if (m_stopped) {
      return;
    }
    m_stopped = true;
    pending.swap(m_mailbox);
  }
  {
    // Wait out a presence update already in flight; later ones see m_stopped
    std::lock_guard<std::mutex> gate(m_presenceGateMutex);
  }

  ACTOR_DEBUG(std::format("Actor {} stopped, {} queued messages dropped", m_id,
                          pending.size()));

  // Wake anyone blocked on a queued command
  for (auto &message : pending) {
    if (message.reject) {
      message.reject();
    }
  }
}

bool Actor::isStopped() const {
  std::lock_guard<std::mutex> lock(m_mailboxMutex);
  return m_stopped;
}

Actor::ObserverId Actor::addObserver(SnapshotObserver observer) {
  std::lock_guard<std::mutex> lock(m_observerMutex);
  const ObserverId id = m_nextObserverId++;
  m_observers.emplace_back(id, std::move(observer));
  return id;
}

bool Actor::removeObserver(ObserverId id) {
  std::lock_guard<std::mutex> lock(m_observerMutex);
  auto it = std::find_if(m_observers.begin(), m_observers.end(),
                         [id](const auto &entry) { return entry.first == id; });
  if (it == m_observers.end()) {
    return false;
  }
  m_observers.erase(it);
  return true;
}

size_t Actor::getPendingMessageCount() const {
  std::lock_guard<std::mutex> lock(m_mailboxMutex);
  return m_mailbox.size();
}

bool Actor::post(Message message) {
  const bool highPriority = message.highPriority;
  {
    std::lock_guard<std::mutex> lock(m_mailboxMutex);
    if (m_stopped) {
      return false;
    }
    m_mailbox.push_back(std::move(message));
    if (m_draining) {
      // The active drain will pick it up
      return true;
    }
    m_draining = true;
  }
  scheduleDrain(highPriority);
  return true;
}

void Actor::scheduleDrain(bool highPriority) {
  auto self = weak_from_this().lock();
  if (self && ThreadSystem::Exists()) {
    const auto priority =
        highPriority ? TaskPriority::High : TaskPriority::Normal;
    if (ThreadSystem::Instance().enqueueTask([self]() { self->drain(); },
                                             priority, "Actor mailbox")) {
      return;
    }
  }
  // No pool to hand off to; drain on the posting thread
  drain();
}

void Actor::drain() {
  for (size_t handled = 0; handled < MAX_MESSAGES_PER_DRAIN; ++handled) {
    Message message;
    {
      std::lock_guard<std::mutex> lock(m_mailboxMutex);
      if (m_stopped || m_mailbox.empty()) {
        m_draining = false;
        return;
      }
      message = std::move(m_mailbox.front());
      m_mailbox.pop_front();
    }

    try {
      message.process();
    } catch (const std::exception &e) {
      ACTOR_ERROR(std::format("Actor {} failed to process message: {}", m_id,
                              e.what()));
      if (message.reject) {
        try {
          message.reject();
        } catch (const std::future_error &fe) {
          ACTOR_ERROR(std::format("Actor {} could not reject message: {}",
                                  m_id, fe.what()));
        }
      }
    }
    m_processedMessages.fetch_add(1, std::memory_order_relaxed);
  }

  {
    std::lock_guard<std::mutex> lock(m_mailboxMutex);
    if (m_stopped || m_mailbox.empty()) {
      m_draining = false;
      return;
    }
  }
  // Still busy: requeue so other actors get a turn on this worker
  scheduleDrain(false);
}

void Actor::handleTick() {
  const auto completed = ResourceRules::processTick(m_record);

  if (completed) {
    // Exactly one harvest per foraging episode, on the Foraging to Idle edge
    const HarvestResult harvest = m_pool.harvest(*completed);
    if (!harvest.empty()) {
      ResourceRules::updateResource(m_record, harvest.kind, harvest.amount);
    }
    reportActivity(Activity::Idle);

    ACTOR_DEBUG(std::format(
        "Actor {} finished foraging at {}: +{} {}", m_id,
        RulesTraits::locationToString(*completed), harvest.amount,
        RulesTraits::resourceKindToString(harvest.kind)));
  }

  publish(ActorSnapshot::fromRecord(m_record));
}

void Actor::reportActivity(Activity activity) {
  std::lock_guard<std::mutex> gate(m_presenceGateMutex);
  if (isStopped()) {
    // Our presence record may already belong to a respawned actor
    return;
  }
  m_presence.updateActivity(m_id, activity);
}

CommandResult Actor::handleCommand(const ActorCommand &command) {
  RulesResult result = RulesResult::Success;

  if (const auto *forage = std::get_if<BeginForaging>(&command)) {
    result = forage->location
                 ? ResourceRules::beginForaging(m_record, *forage->location)
                 : ResourceRules::beginForaging(m_record);
    if (result == RulesResult::Success) {
      reportActivity(Activity::Foraging);
    }
  } else if (const auto *add = std::get_if<AddItem>(&command)) {
    ResourceRules::addItem(m_record, add->kind, add->amount);
  } else if (const auto *remove = std::get_if<RemoveItem>(&command)) {
    result = ResourceRules::removeItem(m_record, remove->kind, remove->amount);
  }

  if (result != RulesResult::Success) {
    ACTOR_DEBUG(std::format("Actor {} rejected command: {}", m_id,
                            RulesTraits::resultToString(result)));
  }

  CommandResult outcome{toCommandStatus(result),
                        ActorSnapshot::fromRecord(m_record)};
  publish(*outcome.snapshot);
  return outcome;
}

void Actor::publish(const ActorSnapshot &snapshot) {
  std::vector<SnapshotObserver> observers;
  {
    std::lock_guard<std::mutex> lock(m_observerMutex);
    if (m_observers.empty()) {
      return;
    }
    observers.reserve(m_observers.size());
    for (const auto &[id, observer] : m_observers) {
      observers.push_back(observer);
    }
  }

  for (const auto &observer : observers) {
    try {
      observer(snapshot);
    } catch (const std::exception &e) {
      ACTOR_ERROR(std::format("Snapshot observer for actor {} threw: {}", m_id,
                              e.what()));
    }
  }
}

} // namespace ColonySim
