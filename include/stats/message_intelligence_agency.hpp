// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include "stats/message_spy.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace devicelink {
namespace stats {

/**
 * MessageIntelligenceAgency - counts messages per (type, group)
 *
 * Each Run() closes the current interval: the interval counters move into
 * last_interval, are logged, and restart at zero. Totals keep accumulating.
 */
class MessageIntelligenceAgency : public MessageSpy {
public:
  struct Entry {
    std::string message_type;
    StatisticsGroup group;
    uint64_t last_interval{0};
    uint64_t total{0};
  };

  void SpyMessage(const std::string &message_type, StatisticsGroup group) override;
  void Run() override;

  // Sorted by (message_type, group)
  std::vector<Entry> GetSnapshot() const;

  uint64_t GetTotal(const std::string &message_type, StatisticsGroup group) const;

  uint64_t run_count() const;

private:
  struct Counter {
    uint64_t current{0};
    uint64_t last_interval{0};
    uint64_t total{0};
  };

  mutable std::mutex mutex_;
  std::map<std::pair<std::string, StatisticsGroup>, Counter> counters_;
  uint64_t runs_{0};
};

} // namespace stats
} // namespace devicelink
