// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include "store/inventory_store.hpp"
#include "util/threadpool.hpp"
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>

namespace devicelink {
namespace store {

/**
 * JsonInventoryStore - InventoryStore backed by <datadir>/inventory.json
 *
 * File format:
 *   {"version": 1, "nodes": {"openflow:1": {"version": 4, "datapath_id": 1,
 *     "address": "10.0.0.1", "port": 6653, "n_tables": 254,
 *     "connected_at": 1700000000}}}
 *
 * Records live in memory; every mutation rewrites the whole file through
 * util::atomic_write_file. FlushAndClose() runs on a small ThreadPool so
 * that disconnect handling never waits on disk I/O.
 *
 * A file that exists but fails to parse is never overwritten: SubmitInitial()
 * fails instead.
 */
class JsonInventoryStore : public InventoryStore {
public:
  struct Options {
    std::filesystem::path datadir;
    size_t worker_threads;

    Options() : worker_threads(1) {}
  };

  explicit JsonInventoryStore(const Options &options);
  ~JsonInventoryStore() override;

  JsonInventoryStore(const JsonInventoryStore &) = delete;
  JsonInventoryStore &operator=(const JsonInventoryStore &) = delete;

  bool SubmitInitial(const InventoryRoot &root) override;
  bool SubmitNode(const NodeRecord &record) override;
  util::PendingOperationPtr FlushAndClose(const std::string &node_id) override;

  // Drain queued flushes and stop the workers. Idempotent.
  // Later FlushAndClose() calls resolve as Failure.
  void Shutdown();

  std::optional<NodeRecord> GetNode(const std::string &node_id) const;
  size_t node_count() const;

  const std::filesystem::path &path() const { return path_; }

  static nlohmann::json RecordToJson(const NodeRecord &record);
  static NodeRecord RecordFromJson(const std::string &node_id, const nlohmann::json &j);

private:
  // Load the file into records_ (absent file = empty). Caller holds mutex_.
  bool LoadLocked();
  // Persist records_. Caller holds mutex_.
  bool PersistLocked() const;

  const std::filesystem::path path_;

  mutable std::mutex mutex_;
  std::map<std::string, NodeRecord> records_;
  bool loaded_{false};

  util::ThreadPool pool_;
};

} // namespace store
} // namespace devicelink
