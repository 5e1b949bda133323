// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "device/rate_limit_coordinator.hpp"
#include "device/device_context.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace devicelink {
namespace device {

uint64_t RateLimitCoordinator::ComputeLimit(uint64_t global_quota,
                                            size_t active_sessions) {
  if (active_sessions == 0) {
    return 0;
  }
  return std::max<uint64_t>(MIN_PACKET_IN_LIMIT, global_quota / active_sessions);
}

uint64_t RateLimitCoordinator::Broadcast(const std::vector<DeviceContextPtr> &sessions,
                                         uint64_t global_quota) {
  uint64_t limit = ComputeLimit(global_quota, sessions.size());
  if (limit == 0) {
    return 0;
  }
  LOG_DEV_DEBUG("Fresh packet-in limit {} for {} devices", limit, sessions.size());
  for (const auto &session : sessions) {
    session->UpdatePacketInRateLimit(limit);
  }
  return limit;
}

} // namespace device
} // namespace devicelink
