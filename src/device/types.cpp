// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "device/types.hpp"

namespace devicelink {
namespace device {

const char *DeviceStateToString(DeviceState state) {
  switch (state) {
  case DeviceState::Connecting:
    return "connecting";
  case DeviceState::Active:
    return "active";
  case DeviceState::Disconnecting:
    return "disconnecting";
  case DeviceState::Closed:
    return "closed";
  }
  return "unknown";
}

NodeId NodeIdFromDatapathId(uint64_t datapath_id) {
  return "openflow:" + std::to_string(datapath_id);
}

} // namespace device
} // namespace devicelink
