// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <cstdint>
#include <filesystem>
#include <iostream> // CLI output and early errors before logger initialized
#include <limits>
#include <system_error>
#include <vector>

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>            Data directory (default: ~/.devicelink)\n"
      << "  --quota=<n>                 Global packet-in quota shared by all devices (default: 64000)\n"
      << "  --barrier-interval-ms=<n>   Outbound barrier interval (default: 500)\n"
      << "  --barrier-count=<n>         Max unacknowledged outbound requests (default: 25600)\n"
      << "  --flush-timeout-ms=<n>      Inventory flush watchdog on disconnect (default: 10000)\n"
      << "  --stats-interval-s=<n>      Message statistics poll interval (default: 10)\n"
      << "  --switch-features-mandatory Reject devices that report no switch features\n"
      << "  --io-threads=<n>            Timer/continuation threads (default: 2)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>          Global log level (trace,debug,info,warn,error,critical)\n"
      << "                              Default: info\n"
      << "  --debug=<component>         Trace logging for component(s): device, store, stats, app, all\n"
      << "                              Can be comma-separated: --debug=device,store\n"
      << "\n"
      << "Other:\n"
      << "  --version                   Show version information\n"
      << "  --help                      Show this help message\n"
      << std::endl;
}

// Parse "<prefix><n>" into [min, max]; prints the error itself
bool parse_option(const std::string &arg, size_t prefix_len, int64_t min,
                  int64_t max, int64_t &out) {
  auto value = devicelink::util::SafeParseInt64(arg.substr(prefix_len), min, max);
  if (!value) {
    std::cerr << "Error: Invalid value in " << arg << " (expected " << min
              << ".." << max << ")" << std::endl;
    return false;
  }
  out = *value;
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    devicelink::app::AppConfig config;
    auto &mc = config.manager_config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      int64_t value = 0;

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << devicelink::GetFullVersionString() << std::endl;
        std::cout << devicelink::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--quota=") == 0) {
        if (!parse_option(arg, 8, 1, kMax, value)) return 1;
        mc.global_notification_quota = static_cast<uint64_t>(value);
      } else if (arg.find("--barrier-interval-ms=") == 0) {
        if (!parse_option(arg, 22, 1, 3600000, value)) return 1;
        mc.barrier_interval = std::chrono::milliseconds(value);
      } else if (arg.find("--barrier-count=") == 0) {
        if (!parse_option(arg, 16, 1, std::numeric_limits<uint32_t>::max(), value)) return 1;
        mc.barrier_count_limit = static_cast<uint32_t>(value);
      } else if (arg.find("--flush-timeout-ms=") == 0) {
        if (!parse_option(arg, 19, 1, 3600000, value)) return 1;
        mc.flush_watchdog_timeout = std::chrono::milliseconds(value);
      } else if (arg.find("--stats-interval-s=") == 0) {
        if (!parse_option(arg, 19, 1, 86400, value)) return 1;
        mc.stats_poll_interval = std::chrono::seconds(value);
      } else if (arg == "--switch-features-mandatory") {
        mc.switch_features_mandatory = true;
      } else if (arg.find("--io-threads=") == 0) {
        auto threads = devicelink::util::SafeParseInt(arg.substr(13), 1, 64);
        if (!threads) {
          std::cerr << "Error: Invalid thread count: " << arg.substr(13) << std::endl;
          return 1;
        }
        config.io_threads = static_cast<size_t>(*threads);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Comma-separated: --debug=device,store
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    // The file logger needs the datadir
    std::error_code ec;
    std::filesystem::create_directories(config.datadir, ec);
    if (ec) {
      std::cerr << "Error: Cannot create data directory " << config.datadir
                << ": " << ec.message() << std::endl;
      return 1;
    }
    std::string log_file = (config.datadir / "debug.log").string();
    devicelink::util::LogManager::Initialize(log_level, true, log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        devicelink::util::LogManager::SetLogLevel("trace");
      } else {
        devicelink::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // Nested scope: app destructor must run before LogManager::Shutdown()
    {
      devicelink::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      app.wait_for_shutdown();
    }

    devicelink::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // Logger may not be safe during exception handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    devicelink::util::LogManager::Shutdown();
    return 1;
  }
}
