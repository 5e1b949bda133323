// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "device/packet_in_rate_limiter.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace devicelink {
namespace device {

PacketInRateLimiter::PacketInRateLimiter(ConnectionAdapterPtr adapter,
                                         uint32_t low_watermark,
                                         uint32_t high_watermark)
    : adapter_(std::move(adapter)), low_watermark_(low_watermark),
      high_watermark_(std::max(high_watermark, low_watermark)) {}

bool PacketInRateLimiter::AcquirePermit() {
  Action action = Action::None;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (throttled_) {
      return false;
    }
    ++occupied_;
    if (occupied_ >= high_watermark_) {
      throttled_ = true;
      action = Action::Throttle;
    }
  }
  Apply(action);
  return true;
}

void PacketInRateLimiter::ReleasePermit() {
  Action action = Action::None;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (occupied_ > 0) {
      --occupied_;
    }
    if (throttled_ && occupied_ <= low_watermark_) {
      throttled_ = false;
      action = Action::Release;
    }
  }
  Apply(action);
}

void PacketInRateLimiter::ChangeWaterMarks(uint32_t low_watermark,
                                           uint32_t high_watermark) {
  Action action = Action::None;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    low_watermark_ = low_watermark;
    high_watermark_ = std::max(high_watermark, low_watermark);
    if (throttled_ && occupied_ <= low_watermark_) {
      throttled_ = false;
      action = Action::Release;
    }
  }
  Apply(action);
}

void PacketInRateLimiter::Apply(Action action) {
  switch (action) {
  case Action::Throttle:
    LOG_DEV_DEBUG("Packet-in high watermark reached, filtering on");
    adapter_->SetPacketInFiltering(true);
    break;
  case Action::Release:
    LOG_DEV_DEBUG("Packet-in back at low watermark, filtering off");
    adapter_->SetPacketInFiltering(false);
    break;
  case Action::None:
    break;
  }
}

bool PacketInRateLimiter::is_throttled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return throttled_;
}

uint32_t PacketInRateLimiter::occupied() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return occupied_;
}

uint32_t PacketInRateLimiter::low_watermark() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return low_watermark_;
}

uint32_t PacketInRateLimiter::high_watermark() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return high_watermark_;
}

} // namespace device
} // namespace devicelink
