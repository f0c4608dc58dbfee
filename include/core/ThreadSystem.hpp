/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 *
 * Thread System: worker pool that executes actor mailboxes and pool
 * maintenance off the scheduler thread
 */

#ifndef THREAD_SYSTEM_HPP
#define THREAD_SYSTEM_HPP

#include "core/Logger.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#if defined(__linux__) || defined(__APPLE__) || defined(_GNU_SOURCE)
#include <pthread.h>
#endif

namespace ColonySim {

// Task priority levels
enum class TaskPriority {
  Critical = 0, // Scheduler bookkeeping
  High = 1,     // Command round-trips a caller is blocked on
  Normal = 2,   // Tick processing
  Low = 3       // Diagnostics
};

constexpr size_t TASK_PRIORITY_COUNT = 4;

struct PrioritizedTask {
  std::function<void()> task;
  std::chrono::steady_clock::time_point enqueueTime;
  std::string description;

  PrioritizedTask(std::function<void()> t, std::string desc)
      : task(std::move(t)), enqueueTime(std::chrono::steady_clock::now()),
        description(std::move(desc)) {}
};

/**
 * @brief Thread-safe task queue with one FIFO deque per priority level
 *
 * Workers always drain the highest non-empty priority first; within a
 * priority tasks run in submission order.
 */
class TaskQueue {
public:
  void push(std::function<void()> task, TaskPriority priority,
            const std::string &description = "") {
    const auto index = static_cast<size_t>(priority);
    {
      std::lock_guard<std::mutex> lock(m_queueMutex);
      if (m_stopping) {
        return;
      }
      m_queues[index].emplace_back(std::move(task), description);
      ++m_pending;
      ++m_totalEnqueued;
    }
    if (priority == TaskPriority::Critical) {
      m_condition.notify_all();
    } else {
      m_condition.notify_one();
    }
  }

  void batchPush(std::vector<std::function<void()>> &tasks,
                 TaskPriority priority, const std::string &description = "") {
    if (tasks.empty()) {
      return;
    }
    const auto index = static_cast<size_t>(priority);
    {
      std::lock_guard<std::mutex> lock(m_queueMutex);
      if (m_stopping) {
        return;
      }
      for (auto &task : tasks) {
        m_queues[index].emplace_back(std::move(task), description);
      }
      m_pending += tasks.size();
      m_totalEnqueued += tasks.size();
    }
    tasks.clear();
    // Large batches wake everyone, small ones avoid a thundering herd
    if (m_pending >= 16 || priority == TaskPriority::Critical) {
      m_condition.notify_all();
    } else {
      m_condition.notify_one();
    }
  }

  // Blocks until a task is available or the queue is stopped
  bool pop(PrioritizedTask &out) {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_condition.wait(lock, [this] { return m_stopping || m_pending > 0; });
    if (m_stopping) {
      return false;
    }
    for (auto &queue : m_queues) {
      if (!queue.empty()) {
        out = std::move(queue.front());
        queue.pop_front();
        --m_pending;
        m_inFlight.fetch_add(1, std::memory_order_acq_rel);
        return true;
      }
    }
    return false;
  }

  /**
   * @brief Stop accepting work and wake every waiting worker
   * @return Tasks that were still queued, highest priority first
   */
  std::vector<PrioritizedTask> stop() {
    std::vector<PrioritizedTask> dropped;
    {
      std::lock_guard<std::mutex> lock(m_queueMutex);
      m_stopping = true;
      dropped.reserve(m_pending);
      for (auto &queue : m_queues) {
        for (auto &task : queue) {
          dropped.push_back(std::move(task));
        }
        queue.clear();
      }
      m_pending = 0;
    }
    m_condition.notify_all();
    return dropped;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_pending;
  }

  // Called by a worker once a popped task has finished
  void taskDone() { m_inFlight.fetch_sub(1, std::memory_order_acq_rel); }

  // Queued plus currently executing; zero only when the pool is idle
  bool hasWork() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_pending > 0 || m_inFlight.load(std::memory_order_acquire) > 0;
  }

  bool isEmpty() const { return size() == 0; }

  bool isStopping() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_stopping;
  }

  size_t getTotalTasksEnqueued() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_totalEnqueued;
  }

private:
  std::array<std::deque<PrioritizedTask>, TASK_PRIORITY_COUNT> m_queues{};
  mutable std::mutex m_queueMutex{};
  std::condition_variable m_condition{};
  size_t m_pending{0};
  size_t m_totalEnqueued{0};
  std::atomic<size_t> m_inFlight{0};
  bool m_stopping{false};
};

// Fixed-size pool of worker threads fed by a single TaskQueue
class ThreadPool {
public:
  explicit ThreadPool(size_t numThreads) {
    m_workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
      m_workers.emplace_back([this, i] {
#if defined(__linux__) || defined(_GNU_SOURCE)
        std::string threadName = std::format("Worker-{}", i);
        pthread_setname_np(pthread_self(), threadName.c_str());
#elif defined(__APPLE__)
        std::string threadName = std::format("Worker-{}", i);
        pthread_setname_np(threadName.c_str());
#endif
        workerThread(i);
      });
    }
  }

  ~ThreadPool() {
    const auto dropped = shutdown();
    if (!dropped.empty()) {
      THREADSYSTEM_WARN(std::format("ThreadPool destroyed with {} tasks unrun",
                                    dropped.size()));
    }
  }

  /**
   * @brief Stop the queue and join every worker
   * @return Tasks that never reached a worker; the caller owns them
   */
  std::vector<PrioritizedTask> shutdown() {
    auto dropped = m_taskQueue.stop();
    for (auto &worker : m_workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    THREADSYSTEM_INFO("ThreadPool shutdown completed");
    return dropped;
  }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  void enqueue(std::function<void()> task,
               TaskPriority priority = TaskPriority::Normal,
               const std::string &description = "") {
    m_taskQueue.push(std::move(task), priority, description);
  }

  void batchEnqueue(std::vector<std::function<void()>> &tasks,
                    TaskPriority priority = TaskPriority::Normal,
                    const std::string &description = "") {
    m_taskQueue.batchPush(tasks, priority, description);
  }

  bool busy() const { return m_taskQueue.hasWork(); }

  TaskQueue &getTaskQueue() { return m_taskQueue; }
  const TaskQueue &getTaskQueue() const { return m_taskQueue; }

  size_t getTotalTasksProcessed() const {
    return m_totalTasksProcessed.load(std::memory_order_relaxed);
  }

private:
  std::vector<std::thread> m_workers;
  TaskQueue m_taskQueue;
  std::atomic<size_t> m_totalTasksProcessed{0};

  void workerThread(size_t threadIndex) {
    PrioritizedTask current{nullptr, ""};
    size_t tasksProcessed = 0;

    while (true) {
      if (!m_taskQueue.pop(current)) {
        break;
      }

      const auto start = std::chrono::steady_clock::now();
      try {
        current.task();
        ++tasksProcessed;
      } catch (const std::exception &e) {
        THREADSYSTEM_ERROR(std::format("Error in worker thread {} ({}): {}",
                                       threadIndex, current.description,
                                       e.what()));
      } catch (...) {
        THREADSYSTEM_ERROR(std::format(
            "Unknown error in worker thread {} ({})", threadIndex,
            current.description));
      }
      current.task = nullptr;
      m_totalTasksProcessed.fetch_add(1, std::memory_order_relaxed);
      m_taskQueue.taskDone();

      const auto elapsedMs =
          std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - start)
              .count();
      if (elapsedMs > 100) {
        THREADSYSTEM_WARN(std::format("Worker {} - Slow task '{}': {}ms",
                                      threadIndex, current.description,
                                      elapsedMs));
      }
    }

    THREADSYSTEM_DEBUG(std::format("Worker {} exiting after processing {} tasks",
                                   threadIndex, tasksProcessed));
    (void)tasksProcessed;
  }
};

// Singleton Thread System Manager
class ThreadSystem {
public:
  static ThreadSystem &Instance() {
    static ThreadSystem instance;
    return instance;
  }

  /**
   * @brief Check whether the ThreadSystem is up and accepting work
   */
  static bool Exists() {
    auto &instance = Instance();
    return !instance.m_isShutdown.load(std::memory_order_acquire) &&
           instance.m_threadPool != nullptr;
  }

  ~ThreadSystem() {
    if (!m_isShutdown.load(std::memory_order_acquire)) {
      clean();
    }
  }

  /**
   * @brief Initialize the worker pool
   *
   * @param customThreadCount Exact worker count, or 0 to use
   * hardware_concurrency - 1 (minimum 1; the scheduler owns its own thread)
   * @return true if the pool is running after the call
   */
  bool init(unsigned int customThreadCount = 0) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_isShutdown.load(std::memory_order_acquire)) {
      THREADSYSTEM_WARN("ThreadSystem already shut down, ignoring init request");
      return false;
    }
    if (m_threadPool) {
      return true;
    }

    if (customThreadCount > 0) {
      m_numThreads = customThreadCount;
    } else {
      const unsigned int hardwareThreads = std::thread::hardware_concurrency();
      m_numThreads = (hardwareThreads > 1) ? (hardwareThreads - 1) : 1;
    }

    try {
      m_threadPool = std::make_unique<ThreadPool>(m_numThreads);
      THREADSYSTEM_INFO(std::format(
          "ThreadSystem initialized with {} worker threads", m_numThreads));
      return true;
    } catch (const std::exception &e) {
      THREADSYSTEM_ERROR(
          std::format("Failed to initialize ThreadSystem: {}", e.what()));
      m_threadPool.reset();
      return false;
    }
  }

  void clean() {
    std::unique_ptr<ThreadPool> pool;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_isShutdown.store(true, std::memory_order_release);
      pool = std::move(m_threadPool);
    }
    if (!pool) {
      return;
    }

    // Queued tasks still run, inline on this thread: an actor whose drain
    // was queued would otherwise keep its mailbox marked busy forever
    auto dropped = pool->shutdown();
    pool.reset();
    if (!dropped.empty()) {
      THREADSYSTEM_INFO(std::format(
          "Running {} pending tasks inline during shutdown...", dropped.size()));
    }
    for (auto &pending : dropped) {
      try {
        pending.task();
      } catch (const std::exception &e) {
        THREADSYSTEM_ERROR(std::format("Error in pending task ({}): {}",
                                       pending.description, e.what()));
      }
    }
    THREADSYSTEM_INFO("ThreadSystem resources cleaned!");
  }

  /**
   * @brief Enqueue a task for execution by the worker pool
   *
   * Never blocks on task execution.
   *
   * @return false if the system is not running and the task was not accepted;
   * the caller decides whether to run it inline or drop it
   */
  bool enqueueTask(std::function<void()> task,
                   TaskPriority priority = TaskPriority::Normal,
                   const std::string &description = "") {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_isShutdown.load(std::memory_order_acquire) || !m_threadPool) {
      return false;
    }
    m_threadPool->enqueue(std::move(task), priority, description);
    return true;
  }

  /**
   * @brief Enqueue many tasks with a single lock acquisition
   * @return false if the system is not running; tasks are left untouched
   */
  bool batchEnqueueTasks(std::vector<std::function<void()>> &tasks,
                         TaskPriority priority = TaskPriority::Normal,
                         const std::string &description = "") {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_isShutdown.load(std::memory_order_acquire) || !m_threadPool) {
      return false;
    }
    m_threadPool->batchEnqueue(tasks, priority, description);
    return true;
  }

  /**
   * @brief Enqueue a task and get a future for its result
   *
   * When the system is not running the task is executed inline so the
   * returned future is always satisfied.
   */
  template <class F>
  auto enqueueTaskWithResult(F &&f, TaskPriority priority = TaskPriority::Normal,
                             const std::string &description = "")
      -> std::future<std::invoke_result_t<F>> {
    using ResultType = std::invoke_result_t<F>;
    auto task =
        std::make_shared<std::packaged_task<ResultType()>>(std::forward<F>(f));
    std::future<ResultType> result = task->get_future();
    if (!enqueueTask([task]() { (*task)(); }, priority, description)) {
      (*task)();
    }
    return result;
  }

  bool isBusy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool && m_threadPool->busy();
  }

  unsigned int getThreadCount() const { return m_numThreads; }

  bool isShutdown() const {
    return m_isShutdown.load(std::memory_order_acquire);
  }

  size_t getQueueSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTaskQueue().size() : 0;
  }

  size_t getTotalTasksProcessed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTotalTasksProcessed() : 0;
  }

  size_t getTotalTasksEnqueued() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTaskQueue().getTotalTasksEnqueued()
                        : 0;
  }

private:
  std::unique_ptr<ThreadPool> m_threadPool{nullptr};
  unsigned int m_numThreads{0};
  std::atomic<bool> m_isShutdown{false};
  mutable std::mutex m_mutex{};

  ThreadSystem(const ThreadSystem &) = delete;
  ThreadSystem &operator=(const ThreadSystem &) = delete;

  ThreadSystem() = default;
};

} // namespace ColonySim

#endif // THREAD_SYSTEM_HPP
