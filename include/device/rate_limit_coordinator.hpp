// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include "device/handlers.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace devicelink {
namespace device {

/**
 * RateLimitCoordinator - shares the global packet-in quota between sessions
 *
 *   limit = max(MIN_PACKET_IN_LIMIT, global_quota / active_sessions)
 *
 * Broadcast() must run inside the same critical section as the registry
 * mutation that changed the session count, so the limit each session sees
 * matches the count it was derived from.
 */
class RateLimitCoordinator {
public:
  static constexpr uint64_t MIN_PACKET_IN_LIMIT = 100;

  // 0 when there are no sessions
  static uint64_t ComputeLimit(uint64_t global_quota, size_t active_sessions);

  // Apply the limit for sessions.size() to every session. Returns the
  // applied limit (0 and no-op for an empty set).
  static uint64_t Broadcast(const std::vector<DeviceContextPtr> &sessions,
                            uint64_t global_quota);
};

} // namespace device
} // namespace devicelink
