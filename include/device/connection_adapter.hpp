#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace devicelink {
namespace device {

// Abstract wire-level connection to one device
// The protocol decoder/encoder lives behind this interface; the lifecycle
// code only needs the handful of controls below.

class OutboundQueueProvider;

using DisconnectCallback = std::function<void()>;

class ConnectionAdapter {
public:
  virtual ~ConnectionAdapter() = default;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;

  // Stable for the lifetime of the connection, unique per process
  virtual uint64_t connection_id() const = 0;

  // Attach the outbound request queue. The adapter creates an OutboundQueue
  // bounded by (max_barrier_count, barrier_interval) and hands it to the
  // provider.
  virtual void RegisterOutboundQueueHandler(
      std::shared_ptr<OutboundQueueProvider> provider,
      uint32_t max_barrier_count, std::chrono::nanoseconds barrier_interval) = 0;

  // Detach the queue registered above (no-op if none)
  virtual void UnregisterOutboundQueueHandler() = 0;

  // While enabled the adapter drops inbound packet-in messages
  virtual void SetPacketInFiltering(bool enabled) = 0;

  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;

  // Invoked once when the connection goes down (remote close, error or Close())
  virtual void SetDisconnectCallback(DisconnectCallback callback) = 0;
};

using ConnectionAdapterPtr = std::shared_ptr<ConnectionAdapter>;

} // namespace device
} // namespace devicelink
