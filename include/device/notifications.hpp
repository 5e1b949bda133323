// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include "device/types.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace devicelink {
namespace device {

enum class NotificationKind { NodeUpdated, NodeRemoved, PacketIn };

const char *NotificationKindToString(NotificationKind kind);

struct DeviceNotification {
  NodeId node_id;
  NotificationKind kind{NotificationKind::NodeUpdated};
  std::vector<uint8_t> payload;
};

// Publishing side of the notification channel
class NotificationPublishService {
public:
  virtual ~NotificationPublishService() = default;

  // Returns false if the notification was not accepted
  virtual bool Offer(const DeviceNotification &notification) = 0;
};

/**
 * Subscribing side of the notification channel
 *
 * Subscribe() returns an RAII handle; destroying it unsubscribes. The service
 * must outlive every handle it hands out.
 */
class NotificationService {
public:
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();

  private:
    friend class NotificationService;
    Subscription(NotificationService *owner, size_t id);

    NotificationService *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  using Callback = std::function<void(const DeviceNotification &)>;

  virtual ~NotificationService() = default;

  [[nodiscard]] virtual Subscription Subscribe(Callback callback) = 0;

protected:
  Subscription MakeSubscription(size_t id) { return Subscription(this, id); }
  virtual void Unsubscribe(size_t id) = 0;
};

/**
 * NotificationBroker - in-process publish/subscribe channel
 *
 * Offer() delivers synchronously on the caller's thread. Callbacks are
 * invoked outside the lock, so they may subscribe or unsubscribe. After
 * Stop() every Offer() is rejected.
 */
class NotificationBroker : public NotificationService,
                           public NotificationPublishService {
public:
  NotificationBroker() = default;

  [[nodiscard]] Subscription Subscribe(Callback callback) override;
  bool Offer(const DeviceNotification &notification) override;

  void Stop() { stopped_.store(true, std::memory_order_release); }

  size_t subscriber_count() const;
  uint64_t offered_count() const { return offered_.load(std::memory_order_relaxed); }

protected:
  void Unsubscribe(size_t id) override;

private:
  struct CallbackEntry {
    size_t id;
    Callback callback;
  };

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{0};
  std::atomic<bool> stopped_{false};
  std::atomic<uint64_t> offered_{0};
};

} // namespace device
} // namespace devicelink
