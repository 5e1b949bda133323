// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "stats/message_intelligence_agency.hpp"
#include "util/logging.hpp"

namespace devicelink {
namespace stats {

const char *StatisticsGroupToString(StatisticsGroup group) {
  switch (group) {
  case StatisticsGroup::FromSwitch:
    return "FROM_SWITCH";
  case StatisticsGroup::FromSwitchTranslateInSuccess:
    return "FROM_SWITCH_TRANSLATE_IN_SUCCESS";
  case StatisticsGroup::FromSwitchTranslateOutFailure:
    return "FROM_SWITCH_TRANSLATE_OUT_FAILURE";
  case StatisticsGroup::FromSwitchPacketInLimitReached:
    return "FROM_SWITCH_PACKET_IN_LIMIT_REACHED_AND_FLOW_DISABLED";
  case StatisticsGroup::FromSwitchPublishedSuccess:
    return "FROM_SWITCH_PUBLISHED_SUCCESS";
  case StatisticsGroup::FromSwitchPublishedFailure:
    return "FROM_SWITCH_PUBLISHED_FAILURE";
  case StatisticsGroup::ToSwitchEnteredQueue:
    return "TO_SWITCH_ENTERED";
  case StatisticsGroup::ToSwitchSubmitSuccess:
    return "TO_SWITCH_SUBMIT_SUCCESS";
  case StatisticsGroup::ToSwitchSubmitFailure:
    return "TO_SWITCH_SUBMIT_FAILURE";
  }
  return "UNKNOWN";
}

void MessageIntelligenceAgency::SpyMessage(const std::string &message_type,
                                           StatisticsGroup group) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &counter = counters_[{message_type, group}];
  ++counter.current;
  ++counter.total;
}

void MessageIntelligenceAgency::Run() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++runs_;
  for (auto &[key, counter] : counters_) {
    counter.last_interval = counter.current;
    counter.current = 0;
    if (counter.last_interval > 0) {
      LOG_STATS_DEBUG("{} {}: +{} (total {})", StatisticsGroupToString(key.second),
                      key.first, counter.last_interval, counter.total);
    }
  }
}

std::vector<MessageIntelligenceAgency::Entry>
MessageIntelligenceAgency::GetSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Entry> entries;
  entries.reserve(counters_.size());
  for (const auto &[key, counter] : counters_) {
    entries.push_back(Entry{key.first, key.second, counter.last_interval, counter.total});
  }
  return entries;
}

uint64_t MessageIntelligenceAgency::GetTotal(const std::string &message_type,
                                             StatisticsGroup group) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counters_.find({message_type, group});
  return it == counters_.end() ? 0 : it->second.total;
}

uint64_t MessageIntelligenceAgency::run_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return runs_;
}

} // namespace stats
} // namespace devicelink
