// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include "device/connection_adapter.hpp"
#include <cstdint>
#include <mutex>

namespace devicelink {
namespace device {

/**
 * PacketInRateLimiter - watermark throttle for inbound packet-in traffic
 *
 * Every packet-in being translated/published holds a permit. Reaching the
 * high watermark switches packet-in filtering on at the adapter; dropping
 * back to the low watermark switches it off again. While throttled, new
 * permits are refused.
 *
 * Watermarks are set by the rate-limit broadcast (see RateLimitCoordinator).
 */
class PacketInRateLimiter {
public:
  PacketInRateLimiter(ConnectionAdapterPtr adapter, uint32_t low_watermark,
                      uint32_t high_watermark);

  bool AcquirePermit();
  void ReleasePermit();

  // Applies new watermarks; may lift the throttle right away
  void ChangeWaterMarks(uint32_t low_watermark, uint32_t high_watermark);

  bool is_throttled() const;
  uint32_t occupied() const;
  uint32_t low_watermark() const;
  uint32_t high_watermark() const;

private:
  enum class Action { None, Throttle, Release };
  void Apply(Action action);

  const ConnectionAdapterPtr adapter_;

  mutable std::mutex mutex_;
  uint32_t low_watermark_;
  uint32_t high_watermark_;
  uint32_t occupied_{0};
  bool throttled_{false};
};

} // namespace device
} // namespace devicelink
