// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace devicelink {
namespace device {

// Device identity, "openflow:<datapath id>"
using NodeId = std::string;

// Negotiated protocol versions (wire values)
constexpr uint8_t OFP_VERSION_1_0 = 0x01;
constexpr uint8_t OFP_VERSION_1_3 = 0x04;

enum class DeviceState { Connecting, Active, Disconnecting, Closed };

const char *DeviceStateToString(DeviceState state);

/**
 * Result of the features handshake on one connection
 * auxiliary_id == 0 identifies the primary connection of a device.
 */
struct DeviceFeatures {
  uint64_t datapath_id{0};
  uint8_t version{OFP_VERSION_1_3};
  uint8_t auxiliary_id{0};
  uint8_t n_tables{0};
  uint32_t capabilities{0};
};

NodeId NodeIdFromDatapathId(uint64_t datapath_id);

} // namespace device
} // namespace devicelink
