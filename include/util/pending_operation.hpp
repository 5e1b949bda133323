// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace devicelink {
namespace util {

/**
 * PendingOperation - completion handle for an asynchronous operation
 *
 * Resolves exactly once with one of three outcomes. The producer calls
 * Complete(); anyone holding the handle may call Cancel(), which resolves
 * the operation as Cancelled if it is still pending. Continuations attached
 * with OnComplete() run once, on the thread that resolves the operation
 * (or immediately on the caller's thread if it already resolved), and never
 * under the internal lock.
 *
 * Cancel() only resolves the handle. Whatever work the producer is still
 * doing keeps running; its later Complete() returns false.
 */
class PendingOperation {
public:
  enum class Outcome { Pending, Success, Failure, Cancelled };

  using Callback = std::function<void(Outcome, const std::string &error)>;

  PendingOperation() = default;

  PendingOperation(const PendingOperation &) = delete;
  PendingOperation &operator=(const PendingOperation &) = delete;

  // Resolve with Success or Failure. Returns false if already resolved.
  bool Complete(Outcome outcome, const std::string &error = "");

  // Resolve as Cancelled if still pending. Returns false if already resolved.
  bool Cancel();

  void OnComplete(Callback callback);

  bool IsDone() const;
  Outcome outcome() const;
  std::string error() const;

private:
  mutable std::mutex mutex_;
  Outcome outcome_{Outcome::Pending};
  std::string error_;
  std::vector<Callback> callbacks_;
};

using PendingOperationPtr = std::shared_ptr<PendingOperation>;

const char *OutcomeToString(PendingOperation::Outcome outcome);

} // namespace util
} // namespace devicelink
