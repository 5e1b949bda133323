// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "device/connection_context.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace devicelink {
namespace device {

ConnectionContextPtr ConnectionContext::Create(ConnectionAdapterPtr adapter,
                                               const DeviceFeatures &features) {
  if (!adapter) {
    throw std::invalid_argument("ConnectionContext: null adapter");
  }
  ConnectionContextPtr context(new ConnectionContext(std::move(adapter), features));

  // Weak capture: the adapter must not keep its own context alive
  std::weak_ptr<ConnectionContext> weak = context;
  context->adapter_->SetDisconnectCallback([weak]() {
    if (auto self = weak.lock()) {
      self->OnAdapterDisconnected();
    }
  });
  return context;
}

ConnectionContext::ConnectionContext(ConnectionAdapterPtr adapter,
                                     const DeviceFeatures &features)
    : adapter_(std::move(adapter)), features_(features),
      node_id_(NodeIdFromDatapathId(features.datapath_id)),
      connection_id_(adapter_->connection_id()) {}

void ConnectionContext::SetDeviceDisconnectedHandler(
    DeviceDisconnectedHandler *handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnected_handler_ = handler;
}

void ConnectionContext::SetOutboundQueueProvider(OutboundQueueProviderPtr provider) {
  std::lock_guard<std::mutex> lock(mutex_);
  outbound_queue_provider_ = std::move(provider);
}

OutboundQueueProviderPtr ConnectionContext::outbound_queue_provider() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outbound_queue_provider_;
}

void ConnectionContext::CloseConnection() {
  adapter_->UnregisterOutboundQueueHandler();
  if (adapter_->IsOpen()) {
    LOG_DEV_DEBUG("Closing connection {} of {} ({}:{})", connection_id_,
                  node_id_, adapter_->remote_address(), adapter_->remote_port());
    adapter_->Close();
  }
}

void ConnectionContext::OnAdapterDisconnected() {
  DeviceDisconnectedHandler *handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = disconnected_handler_;
  }
  if (!handler) {
    LOG_DEV_TRACE("Connection {} of {} went down before admission",
                  connection_id_, node_id_);
    return;
  }
  handler->OnDeviceDisconnected(shared_from_this());
}

} // namespace device
} // namespace devicelink
