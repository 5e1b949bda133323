// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include <memory>

namespace devicelink {
namespace device {

class ConnectionContext;
class DeviceContext;
using ConnectionContextPtr = std::shared_ptr<ConnectionContext>;
using DeviceContextPtr = std::shared_ptr<DeviceContext>;

// Receives connection-down events from a ConnectionContext
class DeviceDisconnectedHandler {
public:
  virtual ~DeviceDisconnectedHandler() = default;
  virtual void OnDeviceDisconnected(const ConnectionContextPtr &connection) = 0;
};

/**
 * Initialization phase, run synchronously at the end of a successful
 * admission. Handler chains (RPC registration, statistics gathering, ...)
 * are expected to end by calling DeviceManager::OnDeviceContextLevelUp,
 * which publishes the device. Throwing aborts the admission.
 */
class DeviceInitializationPhaseHandler {
public:
  virtual ~DeviceInitializationPhaseHandler() = default;
  virtual void OnDeviceContextLevelUp(const DeviceContextPtr &context) = 0;
};

// Termination phase, run asynchronously once the flush of a disconnected
// device has resolved (success, failure or watchdog cancellation)
class DeviceTerminationPhaseHandler {
public:
  virtual ~DeviceTerminationPhaseHandler() = default;
  virtual void OnDeviceContextLevelDown(const DeviceContextPtr &context) = 0;
};

// Notified once when a DeviceContext is closed
class DeviceContextClosedHandler {
public:
  virtual ~DeviceContextClosedHandler() = default;
  virtual void OnDeviceContextClosed(const DeviceContextPtr &context) = 0;
};

} // namespace device
} // namespace devicelink
