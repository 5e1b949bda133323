// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace devicelink {
namespace stats {

// Points in the message path where traffic is counted
enum class StatisticsGroup {
  FromSwitch,
  FromSwitchTranslateInSuccess,
  FromSwitchTranslateOutFailure,
  FromSwitchPacketInLimitReached,
  FromSwitchPublishedSuccess,
  FromSwitchPublishedFailure,
  ToSwitchEnteredQueue,
  ToSwitchSubmitSuccess,
  ToSwitchSubmitFailure,
};

const char *StatisticsGroupToString(StatisticsGroup group);

/**
 * Message statistics sink
 *
 * SpyMessage() is called from connection threads; Run() is called
 * periodically by the DeviceManager's statistics poller.
 */
class MessageSpy {
public:
  virtual ~MessageSpy() = default;

  virtual void SpyMessage(const std::string &message_type, StatisticsGroup group) = 0;
  virtual void Run() = 0;
};

} // namespace stats
} // namespace devicelink
