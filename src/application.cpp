// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <unistd.h> // write(), STDOUT_FILENO (async-signal-safe)

namespace devicelink {
namespace app {

Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  LOG_APP_INFO("{}", GetStartupBanner(config_.datadir.string()));

  if (!init_datadir()) {
    LOG_APP_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_store()) {
    LOG_APP_ERROR("Failed to initialize inventory store");
    return false;
  }

  if (!init_device_manager()) {
    LOG_APP_ERROR("Failed to initialize device manager");
    return false;
  }

  inventory_sub_ = broker_.Subscribe([](const device::DeviceNotification &n) {
    if (n.kind != device::NotificationKind::PacketIn) {
      LOG_APP_INFO("Inventory: {} {}", device::NotificationKindToString(n.kind), n.node_id);
    }
  });

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::init_datadir() {
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());
  if (!util::ensure_directory(config_.datadir)) {
    LOG_APP_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }
  return true;
}

bool Application::init_store() {
  store::JsonInventoryStore::Options options;
  options.datadir = config_.datadir;
  options.worker_threads = config_.store_threads;
  store_ = std::make_unique<store::JsonInventoryStore>(options);
  LOG_APP_DEBUG("Inventory file: {}", store_->path().string());
  return true;
}

bool Application::init_device_manager() {
  try {
    device_manager_ = std::make_unique<device::DeviceManager>(
        io_context_, *store_, statistics_, config_.manager_config);
  } catch (const std::runtime_error &e) {
    LOG_APP_ERROR("{}", e.what());
    return false;
  }

  device_manager_->SetTranslatorLibrary(&translator_);
  device_manager_->SetNotificationService(&broker_);
  device_manager_->SetNotificationPublishService(&broker_);
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }
  if (!device_manager_) {
    LOG_APP_ERROR("Application not initialized");
    return false;
  }

  setup_signal_handlers();

  work_guard_.emplace(boost::asio::make_work_guard(io_context_));
  size_t threads = config_.io_threads == 0 ? 1 : config_.io_threads;
  for (size_t i = 0; i < threads; ++i) {
    io_threads_.emplace_back([this]() { io_context_.run(); });
  }

  device_manager_->Initialize();
  running_ = true;

  LOG_APP_INFO("devicelinkd started ({} io threads, quota {})", threads,
           config_.manager_config.global_notification_quota);
  LOG_APP_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_APP_INFO("Shutting down devicelinkd...");
  running_ = false;

  inventory_sub_.Unsubscribe();

  if (device_manager_) {
    LOG_APP_INFO("Closing device sessions...");
    device_manager_->Shutdown();
  }
  broker_.Stop();

  // Let queued flushes reach the disk before the timers go away
  if (store_) {
    store_->Shutdown();
  }

  work_guard_.reset();
  io_context_.stop();
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  LOG_APP_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);
    (void)ignored;
    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace devicelink
