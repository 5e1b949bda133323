// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include "device/connection_adapter.hpp"
#include "device/handlers.hpp"
#include "device/outbound_queue.hpp"
#include "device/types.hpp"
#include <memory>
#include <mutex>

namespace devicelink {
namespace device {

/**
 * ConnectionContext - one handshaken connection to a device
 *
 * Produced by the connection layer once the features handshake finished:
 * it binds the adapter to the negotiated DeviceFeatures and the derived
 * NodeId. The primary connection of a device has auxiliary_id 0.
 *
 * Identity is the adapter's connection_id(); two contexts describe the same
 * connection iff their ids match.
 *
 * The adapter's disconnect callback is routed to the handler installed with
 * SetDeviceDisconnectedHandler(). Until one is installed the event is
 * dropped. The handler must outlive the adapter.
 */
class ConnectionContext : public std::enable_shared_from_this<ConnectionContext> {
public:
  static ConnectionContextPtr Create(ConnectionAdapterPtr adapter,
                                     const DeviceFeatures &features);

  ConnectionContext(const ConnectionContext &) = delete;
  ConnectionContext &operator=(const ConnectionContext &) = delete;

  const NodeId &node_id() const { return node_id_; }
  const DeviceFeatures &features() const { return features_; }
  ConnectionAdapter &adapter() const { return *adapter_; }
  const ConnectionAdapterPtr &adapter_ptr() const { return adapter_; }
  uint64_t connection_id() const { return connection_id_; }
  bool is_auxiliary() const { return features_.auxiliary_id != 0; }

  void SetDeviceDisconnectedHandler(DeviceDisconnectedHandler *handler);

  void SetOutboundQueueProvider(OutboundQueueProviderPtr provider);
  OutboundQueueProviderPtr outbound_queue_provider() const;

  // Detach the outbound queue and close the adapter
  void CloseConnection();

private:
  ConnectionContext(ConnectionAdapterPtr adapter, const DeviceFeatures &features);

  void OnAdapterDisconnected();

  const ConnectionAdapterPtr adapter_;
  const DeviceFeatures features_;
  const NodeId node_id_;
  const uint64_t connection_id_;

  mutable std::mutex mutex_;
  DeviceDisconnectedHandler *disconnected_handler_{nullptr};
  OutboundQueueProviderPtr outbound_queue_provider_;
};

} // namespace device
} // namespace devicelink
