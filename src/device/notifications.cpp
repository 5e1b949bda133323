// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "device/notifications.hpp"
#include <algorithm>

namespace devicelink {
namespace device {

const char *NotificationKindToString(NotificationKind kind) {
  switch (kind) {
  case NotificationKind::NodeUpdated:
    return "node-updated";
  case NotificationKind::NodeRemoved:
    return "node-removed";
  case NotificationKind::PacketIn:
    return "packet-in";
  }
  return "unknown";
}

// ============================================================================
// NotificationService::Subscription
// ============================================================================

NotificationService::Subscription::Subscription(NotificationService *owner,
                                                size_t id)
    : owner_(owner), id_(id), active_(true) {}

NotificationService::Subscription::~Subscription() { Unsubscribe(); }

NotificationService::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

NotificationService::Subscription &
NotificationService::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void NotificationService::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// NotificationBroker
// ============================================================================

NotificationService::Subscription
NotificationBroker::Subscribe(Callback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;
  callbacks_.push_back(CallbackEntry{id, std::move(callback)});
  return MakeSubscription(id);
}

void NotificationBroker::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const CallbackEntry &entry) {
                                    return entry.id == id;
                                  }),
                   callbacks_.end());
}

bool NotificationBroker::Offer(const DeviceNotification &notification) {
  if (stopped_.load(std::memory_order_acquire)) {
    return false;
  }

  std::vector<Callback> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(callbacks_.size());
    for (const auto &entry : callbacks_) {
      snapshot.push_back(entry.callback);
    }
  }

  offered_.fetch_add(1, std::memory_order_relaxed);
  for (const auto &callback : snapshot) {
    callback(notification);
  }
  return true;
}

size_t NotificationBroker::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

} // namespace device
} // namespace devicelink
