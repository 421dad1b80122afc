// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace blockdag {
namespace util {

/**
 * Thread pool for the consensus pipeline stages
 *
 * - num_threads == 0 selects hardware concurrency
 * - a pool of one thread is a serial executor: tasks run in FIFO order and
 *   never overlap (used for the virtual and pruning processors)
 * - exceptions thrown by a task are logged and delivered through its future;
 *   the worker survives
 * - shutdown() stops intake; queued tasks still run before workers exit
 *
 * Usage:
 *   ThreadPool pool(4, "processors");
 *   auto future = pool.enqueue([](){ return 42; });
 *   int result = future.get();
 */
class ThreadPool {
public:
  /**
   * @param num_threads Number of worker threads (0 = use hardware concurrency)
   * @param name Pool name used in log messages
   * @param max_queue_size Maximum queued tasks (0 = unlimited)
   */
  explicit ThreadPool(size_t num_threads = 0, std::string name = "pool",
                      size_t max_queue_size = 0);

  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  /**
   * Enqueue a task for execution
   * @throws std::runtime_error if pool is stopped or queue is full
   */
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  /**
   * Stop accepting new tasks (pending tasks will still execute)
   * Safe to call multiple times
   */
  void shutdown();

  /**
   * Join all workers. Call after shutdown().
   */
  void wait_for_completion();

  /**
   * Block until the queue is empty and no task is running.
   * The pool keeps accepting work.
   */
  void wait_idle();

  size_t size() const { return workers_.size(); }

  const std::string &name() const { return name_; }

  size_t pending_tasks() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
  }

  bool is_stopped() const {
    return stop_.load(std::memory_order_acquire);
  }

  size_t tasks_completed() const {
    return tasks_completed_.load(std::memory_order_relaxed);
  }

  size_t task_exceptions() const {
    return task_exceptions_.load(std::memory_order_relaxed);
  }

private:
  void worker_loop(size_t index);

  std::string name_;
  std::vector<std::thread> workers_;

  std::queue<std::function<void()>> tasks_;
  size_t max_queue_size_;  // 0 = unlimited
  size_t active_{0};       // tasks currently executing (guarded by queue_mutex_)

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::condition_variable idle_condition_;
  std::atomic<bool> stop_{false};

  std::atomic<size_t> tasks_completed_{0};
  std::atomic<size_t> task_exceptions_{0};
};

template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    if (stop_.load(std::memory_order_acquire))
      throw std::runtime_error("enqueue on stopped ThreadPool " + name_);

    if (max_queue_size_ > 0 && tasks_.size() >= max_queue_size_)
      throw std::runtime_error("ThreadPool " + name_ + " queue full");

    tasks_.emplace([task]() { (*task)(); });
  }
  condition_.notify_one();
  return res;
}

} // namespace util
} // namespace blockdag
