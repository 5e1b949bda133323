// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace devicelink {
namespace device {

/**
 * OutboundQueue - per-connection request queue with barrier accounting
 *
 * Requests get sequential transaction ids (xids) and stay in flight until
 * the device acknowledges them. A barrier acknowledges every request sent
 * before it, so the queue asks for one whenever
 *   - max_barrier_count requests have been sent since the last barrier, or
 *   - barrier_interval has passed with unbarriered requests outstanding.
 *
 * At most max_barrier_count requests may be unacknowledged; Commit() fails
 * once that bound is reached.
 *
 * Thread-safe.
 */
class OutboundQueue {
public:
  using Clock = std::chrono::steady_clock;

  OutboundQueue(uint32_t max_barrier_count,
                std::chrono::nanoseconds barrier_interval);

  // Reserve an xid for a request. std::nullopt if the queue is full.
  std::optional<uint64_t> Commit(const std::string &message_type,
                                 Clock::time_point now = Clock::now());

  bool BarrierDue(Clock::time_point now = Clock::now()) const;

  // Reserve an xid for a barrier request
  uint64_t InsertBarrier(Clock::time_point now = Clock::now());

  // Barrier reply: releases every request up to and including xid
  size_t OnBarrierReply(uint64_t xid);

  // Reply to a single request
  bool OnReply(uint64_t xid);

  size_t in_flight() const;
  size_t unbarriered() const;
  uint32_t max_barrier_count() const { return max_barrier_count_; }
  std::chrono::nanoseconds barrier_interval() const { return barrier_interval_; }

private:
  struct Entry {
    uint64_t xid;
    std::string message_type;
  };

  const uint32_t max_barrier_count_;
  const std::chrono::nanoseconds barrier_interval_;

  mutable std::mutex mutex_;
  std::deque<Entry> in_flight_;
  uint64_t next_xid_{1};
  size_t since_barrier_{0};
  Clock::time_point last_barrier_;
};

using OutboundQueuePtr = std::shared_ptr<OutboundQueue>;

/**
 * OutboundQueueProvider - per-connection holder of the current queue
 *
 * Created by the DeviceManager for the negotiated version and registered with
 * the ConnectionAdapter, which installs (and on reconnect of the channel
 * replaces or clears) the queue.
 */
class OutboundQueueProvider {
public:
  explicit OutboundQueueProvider(uint8_t version) : version_(version) {}

  uint8_t version() const { return version_; }

  void OnConnectionQueueChanged(OutboundQueuePtr queue);

  // nullptr while no queue is installed
  OutboundQueuePtr queue() const;

private:
  const uint8_t version_;
  mutable std::mutex mutex_;
  OutboundQueuePtr queue_;
};

using OutboundQueueProviderPtr = std::shared_ptr<OutboundQueueProvider>;

} // namespace device
} // namespace devicelink
