// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "device/device_context.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <stdexcept>

namespace devicelink {
namespace device {

namespace {
constexpr const char *PACKET_IN = "PacketIn";
} // namespace

DeviceContext::DeviceContext(ConnectionContextPtr primary,
                             store::InventoryStore &store,
                             stats::MessageSpy &spy,
                             bool switch_features_mandatory)
    : primary_(std::move(primary)),
      node_id_(primary_ ? primary_->node_id() : NodeId()), store_(store),
      spy_(spy), switch_features_mandatory_(switch_features_mandatory),
      limiter_(primary_ ? primary_->adapter_ptr() : nullptr,
               INITIAL_LOW_WATERMARK, INITIAL_HIGH_WATERMARK) {
  if (!primary_) {
    throw std::invalid_argument("DeviceContext: null primary connection");
  }
}

void DeviceContext::SetState(DeviceState state, StateKey) {
  DeviceState previous = state_.exchange(state, std::memory_order_acq_rel);
  if (previous != state) {
    LOG_DEV_TRACE("{}: {} -> {}", node_id_, DeviceStateToString(previous),
                  DeviceStateToString(state));
  }
}

bool DeviceContext::TransitionState(DeviceState expected, DeviceState desired,
                                    StateKey) {
  if (!state_.compare_exchange_strong(expected, desired,
                                      std::memory_order_acq_rel)) {
    return false;
  }
  LOG_DEV_TRACE("{}: {} -> {}", node_id_, DeviceStateToString(expected),
                DeviceStateToString(desired));
  return true;
}

DeviceState DeviceContext::ExchangeState(DeviceState desired, StateKey) {
  return state_.exchange(desired, std::memory_order_acq_rel);
}

bool DeviceContext::AddAuxiliaryConnectionContext(
    const ConnectionContextPtr &connection) {
  if (!connection || connection->connection_id() == primary_->connection_id()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return auxiliary_connections_.emplace(connection->connection_id(), connection)
      .second;
}

bool DeviceContext::RemoveAuxiliaryConnectionContext(
    const ConnectionContextPtr &connection) {
  if (!connection) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return auxiliary_connections_.erase(connection->connection_id()) > 0;
}

ConnectionContextPtr
DeviceContext::GetAuxiliaryConnectionContext(uint64_t connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = auxiliary_connections_.find(connection_id);
  return it == auxiliary_connections_.end() ? nullptr : it->second;
}

size_t DeviceContext::auxiliary_connection_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return auxiliary_connections_.size();
}

void DeviceContext::UpdatePacketInRateLimit(uint64_t limit) {
  packet_in_limit_.store(limit, std::memory_order_relaxed);

  // low = 50%, high = 80% of the limit
  uint64_t low = limit / 2;
  uint64_t high = limit * 4 / 5;
  auto clamp = [](uint64_t v) -> uint32_t {
    if (v < 1) return 1;
    if (v > UINT32_MAX) return UINT32_MAX;
    return static_cast<uint32_t>(v);
  };
  limiter_.ChangeWaterMarks(clamp(low), clamp(high));
}

util::PendingOperationPtr DeviceContext::ShuttingDownDataStoreTransactions() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!flush_operation_) {
    LOG_DEV_DEBUG("{}: closing pending inventory writes", node_id_);
    flush_operation_ = store_.FlushAndClose(node_id_);
  }
  return flush_operation_;
}

void DeviceContext::FinalizeBootstrap() {
  const DeviceFeatures &f = features();
  if (switch_features_mandatory_ && f.n_tables == 0) {
    throw std::runtime_error("device " + node_id_ +
                             " reported no switch features");
  }

  store::NodeRecord record;
  record.node_id = node_id_;
  record.version = f.version;
  record.datapath_id = f.datapath_id;
  record.address = primary_->adapter().remote_address();
  record.port = primary_->adapter().remote_port();
  record.n_tables = f.n_tables;
  record.connected_at = util::GetTime();

  if (!store_.SubmitNode(record)) {
    throw std::runtime_error("inventory write for " + node_id_ + " failed");
  }
}

void DeviceContext::OnPublished() {
  LOG_DEV_DEBUG("{}: published", node_id_);
  primary_->adapter().SetPacketInFiltering(false);
  std::vector<ConnectionContextPtr> auxiliaries;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, connection] : auxiliary_connections_) {
      auxiliaries.push_back(connection);
    }
  }
  for (const auto &connection : auxiliaries) {
    connection->adapter().SetPacketInFiltering(false);
  }
  Publish(NotificationKind::NodeUpdated, {});
}

bool DeviceContext::OnPacketIn(const std::vector<uint8_t> &message) {
  spy_.SpyMessage(PACKET_IN, stats::StatisticsGroup::FromSwitch);

  if (!limiter_.AcquirePermit()) {
    LOG_DEV_TRACE("{}: packet-in dropped, limit reached", node_id_);
    spy_.SpyMessage(PACKET_IN, stats::StatisticsGroup::FromSwitchPacketInLimitReached);
    return false;
  }

  const TranslatorLibrary *translator = translator_library();
  std::optional<std::vector<uint8_t>> translated;
  if (translator) {
    translated = translator->TranslatePacketIn(features().version, message);
  }
  if (!translated) {
    spy_.SpyMessage(PACKET_IN, stats::StatisticsGroup::FromSwitchTranslateOutFailure);
    limiter_.ReleasePermit();
    return false;
  }
  spy_.SpyMessage(PACKET_IN, stats::StatisticsGroup::FromSwitchTranslateInSuccess);

  bool published = Publish(NotificationKind::PacketIn, std::move(*translated));
  spy_.SpyMessage(PACKET_IN, published
                                 ? stats::StatisticsGroup::FromSwitchPublishedSuccess
                                 : stats::StatisticsGroup::FromSwitchPublishedFailure);
  limiter_.ReleasePermit();
  return published;
}

void DeviceContext::ShutdownConnection() {
  LOG_DEV_DEBUG("{}: shutting down connections", node_id_);
  std::map<uint64_t, ConnectionContextPtr> auxiliaries;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auxiliaries.swap(auxiliary_connections_);
  }
  for (const auto &[id, connection] : auxiliaries) {
    connection->CloseConnection();
  }
  primary_->CloseConnection();
}

void DeviceContext::AddDeviceContextClosedHandler(DeviceContextClosedHandler *handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_handlers_.push_back(handler);
}

void DeviceContext::Close() {
  std::vector<DeviceContextClosedHandler *> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    handlers.swap(closed_handlers_);
  }

  auto self = shared_from_this();
  for (auto *handler : handlers) {
    try {
      handler->OnDeviceContextClosed(self);
    } catch (const std::exception &e) {
      LOG_DEV_ERROR("{}: closed handler threw: {}", node_id_, e.what());
    }
  }
}

bool DeviceContext::Publish(NotificationKind kind, std::vector<uint8_t> payload) {
  NotificationPublishService *publisher = notification_publish_service();
  if (!publisher) {
    return false;
  }
  DeviceNotification notification;
  notification.node_id = node_id_;
  notification.kind = kind;
  notification.payload = std::move(payload);
  return publisher->Offer(notification);
}

void DeviceContext::SetNotificationService(NotificationService *service) {
  std::lock_guard<std::mutex> lock(mutex_);
  notification_service_ = service;
}

void DeviceContext::SetNotificationPublishService(NotificationPublishService *service) {
  std::lock_guard<std::mutex> lock(mutex_);
  notification_publish_service_ = service;
}

void DeviceContext::SetTranslatorLibrary(const TranslatorLibrary *library) {
  std::lock_guard<std::mutex> lock(mutex_);
  translator_library_ = library;
}

void DeviceContext::SetExtensionConverterProvider(
    const ExtensionConverterProvider *provider) {
  std::lock_guard<std::mutex> lock(mutex_);
  extension_converter_provider_ = provider;
}

NotificationService *DeviceContext::notification_service() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return notification_service_;
}

NotificationPublishService *DeviceContext::notification_publish_service() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return notification_publish_service_;
}

const TranslatorLibrary *DeviceContext::translator_library() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return translator_library_;
}

const ExtensionConverterProvider *DeviceContext::extension_converter_provider() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return extension_converter_provider_;
}

} // namespace device
} // namespace devicelink
