// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace devicelink {
namespace util {

namespace {
std::atomic<int64_t> g_mock_time{0};
} // namespace

int64_t GetTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  using std::chrono::system_clock;
  return std::chrono::duration_cast<std::chrono::seconds>(
             system_clock::now().time_since_epoch())
      .count();
}

void SetMockTime(int64_t time) { g_mock_time.store(time, std::memory_order_relaxed); }

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

std::string FormatTime(int64_t unix_time) {
  const auto t = static_cast<std::time_t>(unix_time);
  std::tm utc{};
  if (gmtime_r(&t, &utc) == nullptr) {
    return "invalid";
  }
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << " UTC";
  return out.str();
}

} // namespace util
} // namespace devicelink
