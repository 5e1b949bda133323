// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include "util/pending_operation.hpp"
#include <cstdint>
#include <map>
#include <string>

namespace devicelink {
namespace store {

// Persisted inventory entry for one connected device
struct NodeRecord {
  std::string node_id;
  uint8_t version{0};
  uint64_t datapath_id{0};
  std::string address;
  uint16_t port{0};
  uint8_t n_tables{0};
  int64_t connected_at{0};
};

// Inventory root; the bootstrap record is the empty root
struct InventoryRoot {
  std::map<std::string, NodeRecord> nodes;
};

/**
 * Persisted-state store for the device inventory
 *
 * SubmitInitial() and SubmitNode() block until the write is durable.
 * FlushAndClose() returns immediately; the handle resolves once pending
 * writes for the node are flushed and its record is removed.
 */
class InventoryStore {
public:
  virtual ~InventoryStore() = default;

  // Merge root into the stored inventory. False on failure.
  virtual bool SubmitInitial(const InventoryRoot &root) = 0;

  virtual bool SubmitNode(const NodeRecord &record) = 0;

  virtual util::PendingOperationPtr FlushAndClose(const std::string &node_id) = 0;
};

} // namespace store
} // namespace devicelink
