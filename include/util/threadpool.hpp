// Copyright (c) 2025 The DeviceLink Developers
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

namespace devicelink {
namespace util {

/**
 * Fixed-size worker pool used for blocking store I/O
 *
 * - A throwing task reports through its future; the worker keeps going
 * - Graceful shutdown: queued tasks still run before workers exit
 * - Optional queue size limit
 *
 * Usage:
 *   ThreadPool pool(2);
 *   auto done = pool.enqueue([this, id] { return PersistRemoval(id); });
 *   pool.shutdown();
 *   pool.wait_for_completion();
 */
class ThreadPool {
public:
  /**
   * @param num_threads Number of worker threads (0 = hardware concurrency)
   * @param max_queue_size Maximum queued tasks (0 = unlimited)
   */
  explicit ThreadPool(size_t num_threads = 0, size_t max_queue_size = 0);

  // Stops accepting tasks and joins the workers after the queue drains
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  /**
   * Enqueue a task for execution
   * @throws std::runtime_error if pool is stopped or queue is full
   */
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<std::invoke_result_t<F, Args...>>;

  // Stop accepting new tasks (queued tasks still execute). Idempotent.
  void shutdown();

  // Join workers; call after shutdown()
  void wait_for_completion();

  size_t size() const { return workers_.size(); }

  size_t pending_tasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
  }

  bool is_stopped() const { return stop_.load(std::memory_order_acquire); }

  size_t task_exceptions() const {
    return task_exceptions_.load(std::memory_order_relaxed);
  }

private:
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  size_t max_queue_size_;

  mutable std::mutex queue_mutex_;
  std::mutex join_mutex_;
  std::condition_variable condition_;
  std::atomic<bool> stop_{false};

  std::atomic<size_t> task_exceptions_{0};
};

template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<std::invoke_result_t<F, Args...>> {
  using return_type = std::invoke_result_t<F, Args...>;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);

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
} // namespace devicelink
