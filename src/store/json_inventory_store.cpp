// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "store/json_inventory_store.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <fstream>

namespace devicelink {
namespace store {

using json = nlohmann::json;

namespace {
constexpr int INVENTORY_FILE_VERSION = 1;
constexpr const char *INVENTORY_FILE_NAME = "inventory.json";
} // namespace

JsonInventoryStore::JsonInventoryStore(const Options &options)
    : path_(options.datadir / INVENTORY_FILE_NAME),
      pool_(options.worker_threads == 0 ? 1 : options.worker_threads) {}

JsonInventoryStore::~JsonInventoryStore() { Shutdown(); }

void JsonInventoryStore::Shutdown() {
  pool_.shutdown();
  pool_.wait_for_completion();
}

json JsonInventoryStore::RecordToJson(const NodeRecord &record) {
  json j;
  j["version"] = record.version;
  j["datapath_id"] = record.datapath_id;
  j["address"] = record.address;
  j["port"] = record.port;
  j["n_tables"] = record.n_tables;
  j["connected_at"] = record.connected_at;
  return j;
}

NodeRecord JsonInventoryStore::RecordFromJson(const std::string &node_id,
                                              const json &j) {
  NodeRecord record;
  record.node_id = node_id;
  record.version = j.value("version", static_cast<uint8_t>(0));
  record.datapath_id = j.value("datapath_id", static_cast<uint64_t>(0));
  record.address = j.value("address", std::string());
  record.port = j.value("port", static_cast<uint16_t>(0));
  record.n_tables = j.value("n_tables", static_cast<uint8_t>(0));
  record.connected_at = j.value("connected_at", static_cast<int64_t>(0));
  return record;
}

bool JsonInventoryStore::LoadLocked() {
  if (loaded_) {
    return true;
  }

  std::ifstream file(path_);
  if (!file.is_open()) {
    LOG_STORE_DEBUG("No inventory file at {}, starting empty", path_.string());
    loaded_ = true;
    return true;
  }

  try {
    json root;
    file >> root;

    const int version = root.value("version", 0);
    if (version != INVENTORY_FILE_VERSION || !root.contains("nodes") ||
        !root["nodes"].is_object()) {
      LOG_STORE_ERROR("Unsupported inventory format/version in {}", path_.string());
      return false;
    }

    for (const auto &[node_id, node] : root["nodes"].items()) {
      if (!node.is_object()) {
        LOG_STORE_WARN("Skipping malformed inventory entry {}", node_id);
        continue;
      }
      records_[node_id] = RecordFromJson(node_id, node);
      LOG_STORE_TRACE("Restored {} (connected {})", node_id,
                      util::FormatTime(records_[node_id].connected_at));
    }
  } catch (const json::exception &e) {
    LOG_STORE_ERROR("Failed to parse inventory file {}: {}", path_.string(), e.what());
    return false;
  }

  LOG_STORE_INFO("Loaded {} inventory records from {}", records_.size(), path_.string());
  loaded_ = true;
  return true;
}

bool JsonInventoryStore::PersistLocked() const {
  json root;
  root["version"] = INVENTORY_FILE_VERSION;
  root["nodes"] = json::object();
  for (const auto &[node_id, record] : records_) {
    root["nodes"][node_id] = RecordToJson(record);
  }

  std::string content;
  try {
    content = root.dump(2);
  } catch (const json::exception &e) {
    LOG_STORE_ERROR("Failed to serialize inventory: {}", e.what());
    return false;
  }

  if (!util::atomic_write_file(path_, content)) {
    LOG_STORE_ERROR("Failed to write inventory to {}", path_.string());
    return false;
  }
  LOG_STORE_TRACE("Wrote {} inventory records", records_.size());
  return true;
}

bool JsonInventoryStore::SubmitInitial(const InventoryRoot &root) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!LoadLocked()) {
    return false;
  }
  for (const auto &[node_id, record] : root.nodes) {
    records_[node_id] = record;
  }
  return PersistLocked();
}

bool JsonInventoryStore::SubmitNode(const NodeRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!LoadLocked()) {
    return false;
  }
  records_[record.node_id] = record;
  LOG_STORE_DEBUG("Stored inventory record for {}", record.node_id);
  return PersistLocked();
}

util::PendingOperationPtr JsonInventoryStore::FlushAndClose(const std::string &node_id) {
  auto operation = std::make_shared<util::PendingOperation>();

  try {
    // The future is not needed: the outcome travels through the operation
    (void)pool_.enqueue([this, node_id, operation]() {
      bool ok;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        ok = LoadLocked();
        if (ok) {
          records_.erase(node_id);
          ok = PersistLocked();
        }
      }
      if (!operation->Complete(ok ? util::PendingOperation::Outcome::Success
                                  : util::PendingOperation::Outcome::Failure,
                               ok ? "" : "inventory write failed")) {
        LOG_STORE_DEBUG("Flush for {} finished after it was resolved ({})", node_id,
                        util::OutcomeToString(operation->outcome()));
      }
    });
  } catch (const std::runtime_error &e) {
    LOG_STORE_WARN("Cannot flush {}: {}", node_id, e.what());
    operation->Complete(util::PendingOperation::Outcome::Failure, e.what());
  }

  return operation;
}

std::optional<NodeRecord> JsonInventoryStore::GetNode(const std::string &node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(node_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t JsonInventoryStore::node_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

} // namespace store
} // namespace devicelink
