// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include "device/device_manager.hpp"
#include "device/extensions.hpp"
#include "device/notifications.hpp"
#include "stats/message_intelligence_agency.hpp"
#include "store/json_inventory_store.hpp"
#include "util/files.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace devicelink {
namespace app {

// Application configuration
struct AppConfig {
  std::filesystem::path datadir;

  device::DeviceManager::Config manager_config;

  // Threads running the io_context (timers, teardown continuations)
  size_t io_threads = 2;

  // Threads flushing inventory writes
  size_t store_threads = 1;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

// Application - wires the inventory store, notification broker, statistics
// and DeviceManager around one io_context, and coordinates shutdown.
//
// The connection layer (handshake, protocol decoding) feeds
// device_manager() with ConnectionContexts; it is not part of this process.
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  device::DeviceManager &device_manager() { return *device_manager_; }
  device::NotificationBroker &notifications() { return broker_; }
  stats::MessageIntelligenceAgency &statistics() { return statistics_; }
  boost::asio::io_context &io_context() { return io_context_; }

  bool is_running() const { return running_; }
  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Declaration order is destruction order in reverse: the manager goes
  // before the services it references, the io_context goes last.
  boost::asio::io_context io_context_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;

  std::unique_ptr<store::JsonInventoryStore> store_;
  stats::MessageIntelligenceAgency statistics_;
  device::NotificationBroker broker_;
  device::PassthroughTranslatorLibrary translator_;
  std::unique_ptr<device::DeviceManager> device_manager_;

  // Must be declared AFTER the broker so it is destroyed BEFORE it
  device::NotificationService::Subscription inventory_sub_;

  bool init_datadir();
  bool init_store();
  bool init_device_manager();

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace devicelink
