// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/threadpool.hpp"

namespace draftops {
namespace util {

ThreadPool::ThreadPool(size_t num_threads, size_t max_queue_size)
    : max_queue_size_(max_queue_size) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) {
      num_threads = 4;
    }
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
  wait_for_completion();
}

void ThreadPool::worker_loop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      condition_.wait(lock, [this] {
        return stop_.load(std::memory_order_acquire) || !tasks_.empty();
      });

      if (stop_.load(std::memory_order_acquire) && tasks_.empty()) {
        return;
      }

      task = std::move(tasks_.front());
      tasks_.pop();
    }

    // Every queued callable is a packaged_task wrapper, which stores any
    // exception in its future instead of letting it escape here.
    task();
    tasks_completed_.fetch_add(1, std::memory_order_relaxed);
  }
}

void ThreadPool::shutdown() {
  stop_.store(true, std::memory_order_release);
  condition_.notify_all();
}

size_t ThreadPool::discard_pending() {
  std::queue<std::function<void()>> dropped;
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    std::swap(dropped, tasks_);
  }
  // Destroying the wrappers breaks their promises; any waiting future
  // observes std::future_error(broken_promise).
  return dropped.size();
}

void ThreadPool::wait_for_completion() {
  for (std::thread &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

} // namespace util
} // namespace draftops
