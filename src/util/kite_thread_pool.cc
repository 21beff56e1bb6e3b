#include "kite_thread_pool.h"
#include "logger.h"
#include <algorithm>
#include <system_error>

namespace kite {

ThreadPool::ThreadPool(size_t num_threads) {
  // Requests block on browser round-trips, so oversubscribe the cores
  if (num_threads == 0) {
    num_threads = std::max<size_t>(4, std::thread::hardware_concurrency() * 2);
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    idle_ = num_threads;
  }
  worker_count_.store(num_threads, std::memory_order_relaxed);
  metrics_.idle_workers.store(static_cast<uint32_t>(num_threads), std::memory_order_relaxed);

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerLoop, this, false);
  }

  LOG_DEBUG("ThreadPool", "Started " + std::to_string(num_threads) + " workers");
}

ThreadPool::~ThreadPool() {
  Shutdown();
}

bool ThreadPool::Post(TaskPriority priority, std::function<void()> func) {
  return Enqueue(priority, std::move(func));
}

bool ThreadPool::Enqueue(TaskPriority priority, std::function<void()> func) {
  std::vector<std::thread> retired;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
      metrics_.tasks_rejected.fetch_add(1, std::memory_order_relaxed);
      return false;
    }

    Task t;
    t.func = std::move(func);
    t.priority = priority;
    t.submitted = std::chrono::steady_clock::now();

    priority_queues_[static_cast<int>(priority)].push(std::move(t));
    metrics_.tasks_submitted.fetch_add(1, std::memory_order_relaxed);
    metrics_.queue_depth.fetch_add(1, std::memory_order_relaxed);

    // A blocked task must never hold up the ones behind it
    if (QueuedTasksLocked() > idle_) {
      SpawnOverflowLocked();
    }
    retired = TakeRetiredLocked();
  }

  queue_cv_.notify_one();

  for (auto& worker : retired) {
    worker.join();
  }
  return true;
}

void ThreadPool::SpawnOverflowLocked() {
  try {
    std::thread worker(&ThreadPool::WorkerLoop, this, true);
    std::thread::id id = worker.get_id();
    overflow_.emplace(id, std::move(worker));
  } catch (const std::system_error& e) {
    // The task stays queued for the next free worker
    LOG_WARN("ThreadPool", std::string("Could not start overflow worker: ") + e.what());
    return;
  }

  ++idle_;
  worker_count_.fetch_add(1, std::memory_order_relaxed);
  metrics_.idle_workers.fetch_add(1, std::memory_order_relaxed);
}

std::vector<std::thread> ThreadPool::TakeRetiredLocked() {
  std::vector<std::thread> retired;
  for (const auto& id : retired_) {
    auto it = overflow_.find(id);
    if (it != overflow_.end()) {
      retired.push_back(std::move(it->second));
      overflow_.erase(it);
    }
  }
  retired_.clear();
  return retired;
}

void ThreadPool::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
      return;  // Already shutdown
    }
    shutdown_.store(true, std::memory_order_release);
  }

  queue_cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  // No overflow worker starts after shutdown_ is set
  std::unordered_map<std::thread::id, std::thread> overflow;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    overflow.swap(overflow_);
    retired_.clear();
  }
  for (auto& entry : overflow) {
    if (entry.second.joinable()) {
      entry.second.join();
    }
  }

  LOG_DEBUG("ThreadPool", "All workers joined");
}

size_t ThreadPool::GetQueueSize() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return QueuedTasksLocked();
}

size_t ThreadPool::QueuedTasksLocked() const {
  size_t total = 0;
  for (const auto& q : priority_queues_) {
    total += q.size();
  }
  return total;
}

bool ThreadPool::HasQueuedTasksLocked() const {
  for (const auto& q : priority_queues_) {
    if (!q.empty()) {
      return true;
    }
  }
  return false;
}

void ThreadPool::WorkerLoop(bool overflow) {
  while (true) {
    Task task;

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);

      if (overflow) {
        if (!HasQueuedTasksLocked()) {
          // Joined by the next Enqueue or by Shutdown
          --idle_;
          retired_.push_back(std::this_thread::get_id());
          worker_count_.fetch_sub(1, std::memory_order_relaxed);
          metrics_.idle_workers.fetch_sub(1, std::memory_order_relaxed);
          return;
        }
      } else {
        queue_cv_.wait(lock, [this] {
          return shutdown_.load(std::memory_order_acquire) || HasQueuedTasksLocked();
        });

        // Drain remaining work before exiting
        if (!HasQueuedTasksLocked()) {
          return;
        }
      }

      for (int i = static_cast<int>(TaskPriority::CRITICAL); i >= 0; --i) {
        auto& q = priority_queues_[i];
        if (!q.empty()) {
          task = std::move(q.front());
          q.pop();
          metrics_.queue_depth.fetch_sub(1, std::memory_order_relaxed);
          break;
        }
      }
      --idle_;
    }

    metrics_.active_workers.fetch_add(1, std::memory_order_relaxed);
    metrics_.idle_workers.fetch_sub(1, std::memory_order_relaxed);

    auto now = std::chrono::steady_clock::now();
    auto wait_us = std::chrono::duration_cast<std::chrono::microseconds>(
        now - task.submitted).count();
    metrics_.total_wait_time_us.fetch_add(wait_us, std::memory_order_relaxed);

    task.func();
    metrics_.tasks_completed.fetch_add(1, std::memory_order_relaxed);

    auto exec_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - now).count();
    metrics_.total_exec_time_us.fetch_add(exec_us, std::memory_order_relaxed);

    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      ++idle_;
    }
    metrics_.active_workers.fetch_sub(1, std::memory_order_relaxed);
    metrics_.idle_workers.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace kite
