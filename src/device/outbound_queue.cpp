// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "device/outbound_queue.hpp"

#include <stdexcept>

namespace devicelink {
namespace device {

OutboundQueue::OutboundQueue(uint32_t max_barrier_count,
                             std::chrono::nanoseconds barrier_interval)
    : max_barrier_count_(max_barrier_count),
      barrier_interval_(barrier_interval), last_barrier_(Clock::now()) {
  if (max_barrier_count_ == 0) {
    throw std::invalid_argument("OutboundQueue: max_barrier_count must be > 0");
  }
}

std::optional<uint64_t> OutboundQueue::Commit(const std::string &message_type,
                                              Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (in_flight_.size() >= max_barrier_count_) {
    return std::nullopt;
  }
  if (since_barrier_ == 0) {
    // The interval counts from the first request after a barrier
    last_barrier_ = now;
  }
  uint64_t xid = next_xid_++;
  in_flight_.push_back(Entry{xid, message_type});
  ++since_barrier_;
  return xid;
}

bool OutboundQueue::BarrierDue(Clock::time_point now) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (since_barrier_ == 0) {
    return false;
  }
  return since_barrier_ >= max_barrier_count_ ||
         now - last_barrier_ >= barrier_interval_;
}

uint64_t OutboundQueue::InsertBarrier(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t xid = next_xid_++;
  since_barrier_ = 0;
  last_barrier_ = now;
  return xid;
}

size_t OutboundQueue::OnBarrierReply(uint64_t xid) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t released = 0;
  while (!in_flight_.empty() && in_flight_.front().xid <= xid) {
    in_flight_.pop_front();
    ++released;
  }
  return released;
}

bool OutboundQueue::OnReply(uint64_t xid) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = in_flight_.begin(); it != in_flight_.end(); ++it) {
    if (it->xid == xid) {
      in_flight_.erase(it);
      return true;
    }
  }
  return false;
}

size_t OutboundQueue::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_.size();
}

size_t OutboundQueue::unbarriered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return since_barrier_;
}

void OutboundQueueProvider::OnConnectionQueueChanged(OutboundQueuePtr queue) {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_ = std::move(queue);
}

OutboundQueuePtr OutboundQueueProvider::queue() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_;
}

} // namespace device
} // namespace devicelink
