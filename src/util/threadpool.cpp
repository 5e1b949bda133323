// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "util/threadpool.hpp"
#include "util/logging.hpp"

namespace devicelink {
namespace util {

ThreadPool::ThreadPool(size_t num_threads, size_t max_queue_size)
    : max_queue_size_(max_queue_size) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) {
      num_threads = 2;
    }
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this] {
      for (;;) {
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

        task();
      }
    });
  }
  LOG_DEBUG("ThreadPool started with {} workers", num_threads);
}

ThreadPool::~ThreadPool() {
  shutdown();
  wait_for_completion();
}

void ThreadPool::shutdown() {
  stop_.store(true, std::memory_order_release);
  condition_.notify_all();
}

void ThreadPool::wait_for_completion() {
  std::lock_guard<std::mutex> lock(join_mutex_);
  for (std::thread &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

} // namespace util
} // namespace devicelink
