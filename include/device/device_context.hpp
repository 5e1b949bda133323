// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

/*
 DeviceContext - per-device session

 Holds everything the controller knows about one connected device:
 - identity (NodeId) and negotiated features of the primary connection
 - lifecycle state {Connecting, Active, Disconnecting, Closed}
 - the primary ConnectionContext (fixed at construction) and a set of
   auxiliary connections keyed by connection id
 - the packet-in rate limit and the limiter enforcing it
 - the flush handle for pending inventory writes, created on first request
 - collaborators injected by the DeviceManager (notification services,
   translator library, extension converters)

 Ownership
 - Owned by the DeviceManager registry while admitted; async teardown
   (flush continuation, watchdog) keeps it alive after removal.

 State transitions
 - Only the DeviceManager changes state; the mutating calls take a
   StateKey that only DeviceManager can construct.

 Threading
 - All public methods are thread-safe.
*/

#include "device/connection_context.hpp"
#include "device/extensions.hpp"
#include "device/handlers.hpp"
#include "device/notifications.hpp"
#include "device/packet_in_rate_limiter.hpp"
#include "device/types.hpp"
#include "stats/message_spy.hpp"
#include "store/inventory_store.hpp"
#include "util/pending_operation.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace devicelink {
namespace device {

class DeviceManager;

class DeviceContext : public std::enable_shared_from_this<DeviceContext> {
public:
  class StateKey {
    friend class DeviceManager;
    StateKey() = default;
  };

  // Limiter watermarks used until the first rate-limit broadcast
  static constexpr uint32_t INITIAL_LOW_WATERMARK = 1000;
  static constexpr uint32_t INITIAL_HIGH_WATERMARK = 2000;

  DeviceContext(ConnectionContextPtr primary, store::InventoryStore &store,
                stats::MessageSpy &spy, bool switch_features_mandatory);

  DeviceContext(const DeviceContext &) = delete;
  DeviceContext &operator=(const DeviceContext &) = delete;

  const NodeId &node_id() const { return node_id_; }
  const DeviceFeatures &features() const { return primary_->features(); }
  const ConnectionContextPtr &primary_connection() const { return primary_; }

  DeviceState state() const { return state_.load(std::memory_order_acquire); }
  void SetState(DeviceState state, StateKey);
  // Atomic compare-and-set; false if the current state is not `expected`
  bool TransitionState(DeviceState expected, DeviceState desired, StateKey);
  // Returns the previous state
  DeviceState ExchangeState(DeviceState desired, StateKey);

  // Set semantics by connection id; false on duplicate or primary
  bool AddAuxiliaryConnectionContext(const ConnectionContextPtr &connection);
  // False if the connection was not an auxiliary of this device
  bool RemoveAuxiliaryConnectionContext(const ConnectionContextPtr &connection);
  ConnectionContextPtr GetAuxiliaryConnectionContext(uint64_t connection_id) const;
  size_t auxiliary_connection_count() const;

  // Called by the rate-limit broadcast only
  void UpdatePacketInRateLimit(uint64_t limit);
  uint64_t packet_in_rate_limit() const {
    return packet_in_limit_.load(std::memory_order_relaxed);
  }
  const PacketInRateLimiter &packet_in_limiter() const { return limiter_; }

  /**
   * Request flush-and-close of pending inventory writes
   * The first call asks the store; later calls return the same handle.
   */
  util::PendingOperationPtr ShuttingDownDataStoreTransactions();

  /**
   * Write the device's inventory record
   * Throws std::runtime_error if the write fails, or if switch features are
   * mandatory and the handshake reported none.
   */
  void FinalizeBootstrap();

  // Device is visible: lift the admission-time packet-in filter and
  // announce it to subscribers
  void OnPublished();

  /**
   * Handle an inbound packet-in from the device
   * Returns true if it was translated and published.
   */
  bool OnPacketIn(const std::vector<uint8_t> &message);

  // Close the primary and every auxiliary connection
  void ShutdownConnection();

  void AddDeviceContextClosedHandler(DeviceContextClosedHandler *handler);

  // Notify closed handlers (once; later calls are no-ops)
  void Close();

  // Collaborators (set by DeviceManager during admission)
  void SetNotificationService(NotificationService *service);
  void SetNotificationPublishService(NotificationPublishService *service);
  void SetTranslatorLibrary(const TranslatorLibrary *library);
  void SetExtensionConverterProvider(const ExtensionConverterProvider *provider);

  NotificationService *notification_service() const;
  NotificationPublishService *notification_publish_service() const;
  const TranslatorLibrary *translator_library() const;
  const ExtensionConverterProvider *extension_converter_provider() const;

private:
  bool Publish(NotificationKind kind, std::vector<uint8_t> payload);

  const ConnectionContextPtr primary_;
  const NodeId node_id_;
  store::InventoryStore &store_;
  stats::MessageSpy &spy_;
  const bool switch_features_mandatory_;

  std::atomic<DeviceState> state_{DeviceState::Connecting};
  std::atomic<uint64_t> packet_in_limit_{0};
  PacketInRateLimiter limiter_;

  mutable std::mutex mutex_;
  std::map<uint64_t, ConnectionContextPtr> auxiliary_connections_;
  util::PendingOperationPtr flush_operation_;
  std::vector<DeviceContextClosedHandler *> closed_handlers_;
  bool closed_{false};

  NotificationService *notification_service_{nullptr};
  NotificationPublishService *notification_publish_service_{nullptr};
  const TranslatorLibrary *translator_library_{nullptr};
  const ExtensionConverterProvider *extension_converter_provider_{nullptr};
};

} // namespace device
} // namespace devicelink
