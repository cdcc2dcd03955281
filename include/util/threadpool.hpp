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
#include <thread>
#include <vector>

namespace draftops {
namespace util {

/**
 * Thread pool for background work off the event-processing path
 *
 * - Exceptions thrown by tasks are delivered through the returned future;
 *   worker threads survive them
 * - Optional queue size limit
 * - shutdown() stops intake; discard_pending() drops work that has not
 *   started yet (used when queued work is safe to lose at exit)
 *
 * Usage:
 *   ThreadPool pool(1);
 *   auto future = pool.enqueue([](){ return 42; });
 *   int result = future.get();
 *   pool.shutdown();
 *   pool.wait_for_completion();
 */
class ThreadPool {
public:
  /**
   * @param num_threads Number of worker threads (0 = use hardware concurrency)
   * @param max_queue_size Maximum queued tasks (0 = unlimited)
   */
  explicit ThreadPool(size_t num_threads = 0, size_t max_queue_size = 0);

  // Stops intake and joins workers after the queue drains
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

  // Stop accepting new tasks (pending tasks will still execute)
  void shutdown();

  // Drop queued tasks that have not started; returns how many were dropped
  size_t discard_pending();

  // Join all workers. Call after shutdown().
  void wait_for_completion();

  size_t size() const { return workers_.size(); }

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

private:
  void worker_loop();

  std::vector<std::thread> workers_;

  std::queue<std::function<void()>> tasks_;
  size_t max_queue_size_; // 0 = unlimited

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::atomic<bool> stop_{false};

  std::atomic<size_t> tasks_completed_{0};
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
      throw std::runtime_error("enqueue on stopped ThreadPool");

    if (max_queue_size_ > 0 && tasks_.size() >= max_queue_size_)
      throw std::runtime_error("ThreadPool queue full");

    tasks_.emplace([task]() { (*task)(); });
  }
  condition_.notify_one();
  return res;
}

} // namespace util
} // namespace draftops
