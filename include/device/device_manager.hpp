// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

/*
 DeviceManager - lifecycle of device connections

 Purpose
 - Admit or reject handshaken connections; at most one DeviceContext exists
   per NodeId at any time
 - Create, register and publish a DeviceContext per admitted device
 - Share the global packet-in quota between active devices
 - Tear sessions down on disconnect, bounding the inventory flush with a
   watchdog timer

 Admission (DeviceConnected)
 - Identity already registered: warn, close the new connection, return false.
   A reconnect that races the teardown of the old session ends up here.
 - Otherwise build the context in Connecting, insert-if-absent into the
   registry, recompute rate limits, mark Active and run the initialization
   phase. If any of that throws, the entry is removed again and the
   connection closed.

 Disconnect (OnDeviceDisconnected)
 - Unknown device: info log, no-op
 - Auxiliary connection: dropped from the context, session stays Active
 - Primary connection: Disconnecting, flush-and-close of pending inventory
   writes, watchdog cancels the flush after flush_watchdog_timeout. Whatever
   the outcome, the continuation (posted to the io_context) runs the
   termination phase and removes the session.
 Shutdown
 - Admissions racing Shutdown() are either drained by it or rejected; no
   session is registered once it returned.

 Threading
 - Connection events may arrive on any thread, concurrently for different
   devices. The registry is a ThreadSafeMap; registry mutation and the rate
   broadcast share registry_size_mutex_.
 - Timers and teardown continuations run on the io_context.
 - The DeviceManager must outlive the io_context's handlers. Flush handles
   held by the store may outlive it: Shutdown() (also run by the destructor)
   detaches their continuations, so a late resolution is ignored.
*/

#include "device/device_context.hpp"
#include "device/extensions.hpp"
#include "device/handlers.hpp"
#include "device/notifications.hpp"
#include "device/types.hpp"
#include "stats/message_spy.hpp"
#include "store/inventory_store.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>
#include <mutex>

namespace devicelink {
namespace device {

class DeviceManager : public DeviceDisconnectedHandler,
                      public DeviceInitializationPhaseHandler,
                      public DeviceTerminationPhaseHandler,
                      public DeviceContextClosedHandler {
public:
  struct Config {
    uint64_t global_notification_quota;       // Shared packet-in budget
    bool switch_features_mandatory;           // Reject devices without features
    std::chrono::milliseconds barrier_interval;
    uint32_t barrier_count_limit;             // Max unacknowledged requests
    std::chrono::milliseconds flush_watchdog_timeout;
    std::chrono::seconds stats_poll_interval;

    Config()
        : global_notification_quota(64000), switch_features_mandatory(false),
          barrier_interval(500), barrier_count_limit(25600),
          flush_watchdog_timeout(10000), stats_poll_interval(10) {}
  };

  /**
   * Seeds the inventory with the empty root record
   * @throws std::runtime_error if the store rejects it
   */
  DeviceManager(boost::asio::io_context &io_context, store::InventoryStore &store,
                stats::MessageSpy &spy, const Config &config = Config{});

  ~DeviceManager() override;

  DeviceManager(const DeviceManager &) = delete;
  DeviceManager &operator=(const DeviceManager &) = delete;

  // Start the periodic statistics poller. Idempotent.
  void Initialize();

  // Drain every session without waiting for flushes and stop the poller.
  // Idempotent; later admissions are rejected.
  void Shutdown();

  /**
   * Admit a handshaken primary connection
   * @throws std::invalid_argument on null connection
   * @throws std::logic_error if the registry insert loses a race
   */
  bool DeviceConnected(const ConnectionContextPtr &connection);

  // Attach an auxiliary connection to an admitted device
  bool DeviceAuxiliaryConnected(const ConnectionContextPtr &connection);

  // DeviceDisconnectedHandler
  void OnDeviceDisconnected(const ConnectionContextPtr &connection) override;

  // DeviceInitializationPhaseHandler: final step, writes the inventory
  // record and publishes the device
  void OnDeviceContextLevelUp(const DeviceContextPtr &context) override;

  // DeviceTerminationPhaseHandler: removes the session (idempotent)
  void OnDeviceContextLevelDown(const DeviceContextPtr &context) override;

  // DeviceContextClosedHandler
  void OnDeviceContextClosed(const DeviceContextPtr &context) override;

  // nullptr if absent
  DeviceContextPtr GetDeviceContext(const NodeId &node_id) const;
  size_t device_count() const { return device_contexts_.Size(); }

  bool is_polling() const { return polling_.load(std::memory_order_acquire); }
  bool is_shutdown() const { return shutdown_.load(std::memory_order_acquire); }
  const Config &config() const { return config_; }

  // Setters: call once, before the first connection
  void SetTranslatorLibrary(const TranslatorLibrary *library) { translator_library_ = library; }
  void SetNotificationService(NotificationService *service) { notification_service_ = service; }
  void SetNotificationPublishService(NotificationPublishService *service) {
    notification_publish_service_ = service;
  }
  void SetExtensionConverterProvider(const ExtensionConverterProvider *provider) {
    extension_converter_provider_ = provider;
  }
  // nullptr restores the default (this manager)
  void SetDeviceInitializationPhaseHandler(DeviceInitializationPhaseHandler *handler) {
    init_phase_handler_ = handler ? handler : this;
  }
  void SetDeviceTerminationPhaseHandler(DeviceTerminationPhaseHandler *handler) {
    termination_phase_handler_ = handler;
  }

  const TranslatorLibrary *translator_library() const { return translator_library_; }
  const ExtensionConverterProvider *extension_converter_provider() const {
    return extension_converter_provider_;
  }

private:
  // Caller holds registry_size_mutex_
  void UpdatePacketInRateLimiters();

  void RegisterOutboundQueue(const ConnectionContextPtr &connection);

  // Runs on the io_context once the flush of `context` resolved
  void CompleteDeviceTeardown(const DeviceContextPtr &context,
                              util::PendingOperation::Outcome outcome,
                              const std::string &error);

  void ScheduleStatsPoll();

  boost::asio::io_context &io_context_;
  store::InventoryStore &store_;
  stats::MessageSpy &spy_;
  const Config config_;

  util::ThreadSafeMap<NodeId, DeviceContextPtr> device_contexts_;
  std::mutex registry_size_mutex_;

  std::atomic<bool> shutdown_{false};

  std::mutex stats_mutex_;
  boost::asio::steady_timer stats_timer_;
  std::atomic<bool> polling_{false};

  // Shared with pending flush continuations; closed by Shutdown()
  struct TeardownGate {
    std::mutex mutex;
    bool open{true};
  };
  std::shared_ptr<TeardownGate> teardown_gate_;

  const TranslatorLibrary *translator_library_{nullptr};
  NotificationService *notification_service_{nullptr};
  NotificationPublishService *notification_publish_service_{nullptr};
  const ExtensionConverterProvider *extension_converter_provider_{nullptr};
  DeviceInitializationPhaseHandler *init_phase_handler_{this};
  DeviceTerminationPhaseHandler *termination_phase_handler_{nullptr};
};

} // namespace device
} // namespace devicelink
