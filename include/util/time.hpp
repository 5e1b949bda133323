// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace devicelink {
namespace util {

/*
 Wall-clock source for inventory timestamps

 NodeRecord::connected_at is taken from GetTime(). Tests pin it with
 SetMockTime() / MockTimeScope; while a mock value is set the clock does not
 advance. Timers (flush watchdog, statistics poll) run on asio's steady clock
 and are not affected.
*/

// Seconds since the Unix epoch; the mock value if one is set
int64_t GetTime();

// 0 switches back to the system clock
void SetMockTime(int64_t time);
int64_t GetMockTime();

// "YYYY-MM-DD HH:MM:SS UTC", used when logging restored inventory records
std::string FormatTime(int64_t unix_time);

// Mock time for the lifetime of the object; restores the previous value
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }
  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace devicelink
