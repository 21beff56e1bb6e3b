#pragma once

#include <array>
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <memory>
#include <chrono>
#include <string>
#include <unordered_map>

// Worker pool for inbound API requests.
// One request occupies one worker for its whole duration, including any
// wait or static delay. The core workers live as long as the pool; a task
// queued while every worker is busy gets an overflow worker of its own,
// which exits once the queue is empty.

namespace kite {

enum class TaskPriority {
  LOW = 0,
  NORMAL = 1,
  HIGH = 2,
  CRITICAL = 3
};

struct TaskMetrics {
  std::atomic<uint64_t> tasks_submitted{0};
  std::atomic<uint64_t> tasks_completed{0};
  std::atomic<uint64_t> tasks_rejected{0};
  std::atomic<uint64_t> total_wait_time_us{0};
  std::atomic<uint64_t> total_exec_time_us{0};
  std::atomic<uint32_t> active_workers{0};
  std::atomic<uint32_t> idle_workers{0};
  std::atomic<uint32_t> queue_depth{0};
};

class ThreadPool {
public:
  // Core worker count; 0 uses hardware_concurrency * 2, at least 4
  explicit ThreadPool(size_t num_threads = 0);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  // Submit a task with priority, returns future for result.
  // After Shutdown() the task is dropped and the future never becomes ready.
  template<typename F, typename... Args>
  auto Submit(TaskPriority priority, F&& f, Args&&... args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  template<typename F, typename... Args>
  auto Submit(F&& f, Args&&... args)
      -> std::future<typename std::invoke_result<F, Args...>::type> {
    return Submit(TaskPriority::NORMAL, std::forward<F>(f), std::forward<Args>(args)...);
  }

  // Fire-and-forget. Returns false if the pool is shut down and the task was not queued.
  bool Post(TaskPriority priority, std::function<void()> func);

  // Drains queued tasks, then joins all workers
  void Shutdown();

  TaskMetrics& GetMetrics() { return metrics_; }
  const TaskMetrics& GetMetrics() const { return metrics_; }

  // Core plus live overflow workers
  size_t GetWorkerCount() const { return worker_count_.load(std::memory_order_relaxed); }
  size_t GetQueueSize() const;
  bool IsShutdown() const { return shutdown_.load(std::memory_order_acquire); }

private:
  struct Task {
    std::function<void()> func;
    TaskPriority priority;
    std::chrono::steady_clock::time_point submitted;
  };

  bool Enqueue(TaskPriority priority, std::function<void()> func);
  void WorkerLoop(bool overflow);
  bool HasQueuedTasksLocked() const;
  size_t QueuedTasksLocked() const;
  void SpawnOverflowLocked();
  std::vector<std::thread> TakeRetiredLocked();

  std::vector<std::thread> workers_;
  std::atomic<size_t> worker_count_{0};

  // Guarded by queue_mutex_
  std::unordered_map<std::thread::id, std::thread> overflow_;
  std::vector<std::thread::id> retired_;  // exited, not yet joined
  size_t idle_ = 0;                       // workers not running a task

  // One queue per TaskPriority
  std::array<std::queue<Task>, 4> priority_queues_;
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;

  std::atomic<bool> shutdown_{false};

  TaskMetrics metrics_;
};

// ============================================================
// Template Implementations
// ============================================================

template<typename F, typename... Args>
auto ThreadPool::Submit(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...)
  );

  std::future<return_type> result = task->get_future();
  Enqueue(priority, [task]() { (*task)(); });
  return result;
}

}  // namespace kite
