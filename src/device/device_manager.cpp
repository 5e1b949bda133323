// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "device/device_manager.hpp"
#include "device/rate_limit_coordinator.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>
#include <stdexcept>

namespace devicelink {
namespace device {

using Outcome = util::PendingOperation::Outcome;

DeviceManager::DeviceManager(boost::asio::io_context &io_context,
                             store::InventoryStore &store,
                             stats::MessageSpy &spy, const Config &config)
    : io_context_(io_context), store_(store), spy_(spy), config_(config),
      stats_timer_(io_context), teardown_gate_(std::make_shared<TeardownGate>()) {
  // Seed the inventory root so node records have a parent
  if (!store_.SubmitInitial(store::InventoryRoot{})) {
    LOG_DEV_ERROR("Creation of the inventory root failed");
    throw std::runtime_error("DeviceManager: inventory bootstrap failed");
  }
  LOG_DEV_DEBUG("DeviceManager created (quota {}, barrier {} / {} ms, flush watchdog {} ms)",
                config_.global_notification_quota, config_.barrier_count_limit,
                config_.barrier_interval.count(),
                config_.flush_watchdog_timeout.count());
}

DeviceManager::~DeviceManager() { Shutdown(); }

// === Admission ===

bool DeviceManager::DeviceConnected(const ConnectionContextPtr &connection) {
  if (!connection) {
    throw std::invalid_argument("DeviceConnected: null connection context");
  }
  if (shutdown_.load(std::memory_order_acquire)) {
    LOG_DEV_DEBUG("Rejecting {}: shutting down", connection->node_id());
    connection->CloseConnection();
    return false;
  }

  const NodeId &node_id = connection->node_id();
  ConnectionAdapter &adapter = connection->adapter();

  // A context still present means the previous session is being torn down
  // (connection flapping). The live session keeps its connection.
  if (device_contexts_.Contains(node_id)) {
    LOG_DEV_WARN("Rejecting connection from {} ({}:{}): device context still exists",
                 node_id, adapter.remote_address(), adapter.remote_port());
    connection->CloseConnection();
    return false;
  }

  LOG_DEV_INFO("Device connected: {} from {}:{} (version 0x{:02x})", node_id,
               adapter.remote_address(), adapter.remote_port(),
               connection->features().version);

  connection->SetDeviceDisconnectedHandler(this);
  // Lifted again in DeviceContext::OnPublished()
  adapter.SetPacketInFiltering(true);
  RegisterOutboundQueue(connection);

  auto context = std::make_shared<DeviceContext>(
      connection, store_, spy_, config_.switch_features_mandatory);

  bool shut_down = false;
  {
    std::lock_guard<std::mutex> lock(registry_size_mutex_);
    // Shutdown() flips the flag before it drains under this mutex, so a
    // check here either sees it or is drained by it
    if (shutdown_.load(std::memory_order_acquire)) {
      shut_down = true;
    } else if (!device_contexts_.TryInsert(node_id, context)) {
      adapter.UnregisterOutboundQueueHandler();
      LOG_DEV_ERROR("Device context for {} appeared during admission", node_id);
      throw std::logic_error("device context for " + node_id + " still not closed");
    } else {
      context->AddDeviceContextClosedHandler(this);
      context->SetExtensionConverterProvider(extension_converter_provider_);
      context->SetTranslatorLibrary(translator_library_);
      context->SetNotificationService(notification_service_);
      context->SetNotificationPublishService(notification_publish_service_);
      UpdatePacketInRateLimiters();
    }
  }

  if (shut_down) {
    LOG_DEV_DEBUG("Rejecting {}: shut down during admission", node_id);
    // Also releases the outbound queue registration
    connection->CloseConnection();
    return false;
  }

  try {
    if (!context->TransitionState(DeviceState::Connecting, DeviceState::Active,
                                  DeviceContext::StateKey{})) {
      // Disconnect arrived while setting up; its teardown owns the context
      LOG_DEV_INFO("{} disconnected during admission", node_id);
      return false;
    }
    init_phase_handler_->OnDeviceContextLevelUp(context);
  } catch (const std::exception &e) {
    LOG_DEV_ERROR("Initialization of {} failed: {}", node_id, e.what());
    {
      std::lock_guard<std::mutex> lock(registry_size_mutex_);
      if (device_contexts_.EraseIf(node_id, [&](const DeviceContextPtr &c) {
            return c == context;
          })) {
        UpdatePacketInRateLimiters();
      }
    }
    context->SetState(DeviceState::Closed, DeviceContext::StateKey{});
    context->ShutdownConnection();
    return false;
  }

  return true;
}

bool DeviceManager::DeviceAuxiliaryConnected(const ConnectionContextPtr &connection) {
  if (!connection) {
    throw std::invalid_argument("DeviceAuxiliaryConnected: null connection context");
  }
  if (shutdown_.load(std::memory_order_acquire)) {
    connection->CloseConnection();
    return false;
  }

  DeviceContextPtr context = GetDeviceContext(connection->node_id());
  if (!context) {
    LOG_DEV_WARN("Auxiliary connection for unknown device {}", connection->node_id());
    return false;
  }
  if (!context->AddAuxiliaryConnectionContext(connection)) {
    LOG_DEV_DEBUG("Auxiliary connection {} of {} already known",
                  connection->connection_id(), connection->node_id());
    return false;
  }

  connection->SetDeviceDisconnectedHandler(this);
  RegisterOutboundQueue(connection);
  LOG_DEV_DEBUG("Auxiliary connection {} (aux id {}) attached to {}",
                connection->connection_id(), connection->features().auxiliary_id,
                connection->node_id());
  return true;
}

void DeviceManager::RegisterOutboundQueue(const ConnectionContextPtr &connection) {
  auto provider = std::make_shared<OutboundQueueProvider>(connection->features().version);
  connection->SetOutboundQueueProvider(provider);
  connection->adapter().RegisterOutboundQueueHandler(
      provider, config_.barrier_count_limit,
      std::chrono::duration_cast<std::chrono::nanoseconds>(config_.barrier_interval));
}

void DeviceManager::OnDeviceContextLevelUp(const DeviceContextPtr &context) {
  if (!context) {
    throw std::invalid_argument("OnDeviceContextLevelUp: null device context");
  }
  LOG_DEV_DEBUG("Final phase of level up for {}", context->node_id());
  context->FinalizeBootstrap();
  context->OnPublished();
}

// === Disconnect ===

void DeviceManager::OnDeviceDisconnected(const ConnectionContextPtr &connection) {
  if (!connection) {
    throw std::invalid_argument("OnDeviceDisconnected: null connection context");
  }
  const NodeId &node_id = connection->node_id();
  LOG_DEV_TRACE("OnDeviceDisconnected for {} (connection {})", node_id,
                connection->connection_id());

  DeviceContextPtr context = GetDeviceContext(node_id);
  if (!context) {
    LOG_DEV_INFO("Device context for {} not found; connection terminated without a session",
                 node_id);
    return;
  }

  if (connection->connection_id() != context->primary_connection()->connection_id()) {
    if (context->RemoveAuxiliaryConnectionContext(connection)) {
      LOG_DEV_DEBUG("Auxiliary connection {} of {} removed",
                    connection->connection_id(), node_id);
    }
    return;
  }

  if (!context->TransitionState(DeviceState::Active, DeviceState::Disconnecting,
                                DeviceContext::StateKey{}) &&
      !context->TransitionState(DeviceState::Connecting, DeviceState::Disconnecting,
                                DeviceContext::StateKey{})) {
    LOG_DEV_DEBUG("{} already {}", node_id, DeviceStateToString(context->state()));
    return;
  }

  LOG_DEV_INFO("Device disconnected: {}", node_id);

  util::PendingOperationPtr flush = context->ShuttingDownDataStoreTransactions();

  // Flush may hang (e.g. store unreachable); never wait on it forever
  auto watchdog = std::make_shared<boost::asio::steady_timer>(
      io_context_, config_.flush_watchdog_timeout);
  auto timeout = config_.flush_watchdog_timeout;
  watchdog->async_wait([flush, node_id, timeout](const boost::system::error_code &ec) {
    if (ec) {
      return;
    }
    if (!flush->IsDone()) {
      LOG_DEV_INFO("Closing inventory writes for {} did not complete within {} ms, continuing anyway",
                   node_id, timeout.count());
      flush->Cancel();
    }
  });

  // The store may resolve the flush after this manager is gone; the gate
  // turns such late completions into no-ops
  std::shared_ptr<TeardownGate> gate = teardown_gate_;
  flush->OnComplete([this, gate, context, watchdog](Outcome outcome,
                                                    const std::string &error) {
    std::lock_guard<std::mutex> lock(gate->mutex);
    if (!gate->open) {
      LOG_DEV_DEBUG("Flush for {} resolved after shutdown ({})", context->node_id(),
                    util::OutcomeToString(outcome));
      return;
    }
    boost::asio::post(io_context_, [this, gate, context, watchdog, outcome, error]() {
      watchdog->cancel();
      {
        std::lock_guard<std::mutex> gate_lock(gate->mutex);
        if (!gate->open) {
          return;
        }
      }
      CompleteDeviceTeardown(context, outcome, error);
    });
  });
}

void DeviceManager::CompleteDeviceTeardown(const DeviceContextPtr &context,
                                           Outcome outcome,
                                           const std::string &error) {
  switch (outcome) {
  case Outcome::Success:
    LOG_DEV_DEBUG("Inventory writes for {} closed", context->node_id());
    break;
  case Outcome::Failure:
    LOG_DEV_WARN("Closing inventory writes for {} failed: {}", context->node_id(), error);
    break;
  case Outcome::Cancelled:
    LOG_DEV_DEBUG("Inventory writes for {} abandoned", context->node_id());
    break;
  case Outcome::Pending:
    break;
  }

  if (termination_phase_handler_) {
    try {
      termination_phase_handler_->OnDeviceContextLevelDown(context);
    } catch (const std::exception &e) {
      LOG_DEV_ERROR("Termination phase for {} threw: {}", context->node_id(), e.what());
    }
  }

  // Closed handlers include this manager, which removes the session
  context->Close();
}

void DeviceManager::OnDeviceContextClosed(const DeviceContextPtr &context) {
  OnDeviceContextLevelDown(context);
}

void DeviceManager::OnDeviceContextLevelDown(const DeviceContextPtr &context) {
  if (!context) {
    return;
  }
  const NodeId &node_id = context->node_id();
  LOG_DEV_DEBUG("Level down for {}", node_id);

  {
    std::lock_guard<std::mutex> lock(registry_size_mutex_);
    if (device_contexts_.EraseIf(node_id, [&](const DeviceContextPtr &c) {
          return c == context;
        })) {
      UpdatePacketInRateLimiters();
    }
  }

  if (context->ExchangeState(DeviceState::Closed, DeviceContext::StateKey{}) ==
      DeviceState::Closed) {
    return;
  }

  if (notification_publish_service_) {
    DeviceNotification notification;
    notification.node_id = node_id;
    notification.kind = NotificationKind::NodeRemoved;
    notification_publish_service_->Offer(notification);
  }
  LOG_DEV_INFO("Device {} removed ({} active)", node_id, device_contexts_.Size());
}

// === Rate limits ===

void DeviceManager::UpdatePacketInRateLimiters() {
  RateLimitCoordinator::Broadcast(device_contexts_.GetValues(),
                                  config_.global_notification_quota);
}

// === Lookup ===

DeviceContextPtr DeviceManager::GetDeviceContext(const NodeId &node_id) const {
  DeviceContextPtr context;
  device_contexts_.Read(node_id, [&](const DeviceContextPtr &c) { context = c; });
  return context;
}

// === Bootstrap / shutdown ===

void DeviceManager::Initialize() {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  if (shutdown_.load(std::memory_order_acquire) ||
      polling_.load(std::memory_order_acquire)) {
    return;
  }
  polling_.store(true, std::memory_order_release);
  LOG_DEV_DEBUG("Statistics poller started ({}s interval)",
                config_.stats_poll_interval.count());
  ScheduleStatsPoll();
}

void DeviceManager::ScheduleStatsPoll() {
  // Caller holds stats_mutex_
  stats_timer_.expires_after(config_.stats_poll_interval);
  stats_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || !polling_.load(std::memory_order_acquire)) {
      return;
    }
    spy_.Run();
    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (polling_.load(std::memory_order_acquire)) {
      ScheduleStatsPoll();
    }
  });
}

void DeviceManager::Shutdown() {
  if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  {
    // In-flight teardowns are abandoned; the drain below closes their sessions
    std::lock_guard<std::mutex> lock(teardown_gate_->mutex);
    teardown_gate_->open = false;
  }

  std::vector<std::pair<NodeId, DeviceContextPtr>> drained;
  {
    std::lock_guard<std::mutex> lock(registry_size_mutex_);
    drained = device_contexts_.TakeAll();
  }

  for (auto &entry : drained) {
    const DeviceContextPtr &context = entry.second;
    context->SetState(DeviceState::Closed, DeviceContext::StateKey{});
    context->ShutdownConnection();
    // Not awaited
    context->ShuttingDownDataStoreTransactions();
  }

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    polling_.store(false, std::memory_order_release);
    stats_timer_.cancel();
  }

  if (!drained.empty()) {
    LOG_DEV_INFO("DeviceManager shut down, closed {} devices", drained.size());
  }
}

} // namespace device
} // namespace devicelink
