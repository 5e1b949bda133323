// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include "util/pending_operation.hpp"

#include <stdexcept>

namespace devicelink {
namespace util {

bool PendingOperation::Complete(Outcome outcome, const std::string &error) {
  if (outcome == Outcome::Pending) {
    throw std::invalid_argument("PendingOperation cannot complete as Pending");
  }

  std::vector<Callback> to_run;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outcome_ != Outcome::Pending) {
      return false;
    }
    outcome_ = outcome;
    error_ = error;
    to_run.swap(callbacks_);
  }

  for (auto &cb : to_run) {
    cb(outcome, error);
  }
  return true;
}

bool PendingOperation::Cancel() {
  return Complete(Outcome::Cancelled, "cancelled");
}

void PendingOperation::OnComplete(Callback callback) {
  Outcome resolved;
  std::string error;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outcome_ == Outcome::Pending) {
      callbacks_.push_back(std::move(callback));
      return;
    }
    resolved = outcome_;
    error = error_;
  }
  callback(resolved, error);
}

bool PendingOperation::IsDone() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outcome_ != Outcome::Pending;
}

PendingOperation::Outcome PendingOperation::outcome() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outcome_;
}

std::string PendingOperation::error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

const char *OutcomeToString(PendingOperation::Outcome outcome) {
  switch (outcome) {
  case PendingOperation::Outcome::Pending:
    return "pending";
  case PendingOperation::Outcome::Success:
    return "success";
  case PendingOperation::Outcome::Failure:
    return "failure";
  case PendingOperation::Outcome::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

} // namespace util
} // namespace devicelink
