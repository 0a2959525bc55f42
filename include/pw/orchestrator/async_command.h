#pragma once
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace pw::orchestrator {

// Receives job output. `source` is empty for the job's own lines and carries
// the display name for lines of a background command.
using OutputSink = std::function<void(std::string_view source, std::string_view line)>;

// One background plugin command. Joined (and destroyed) by its ledger.
class AsyncCommandHandle {
 public:
  using Work = std::function<void(AsyncCommandHandle&)>;

  AsyncCommandHandle(std::string display_name, OutputSink sink);
  ~AsyncCommandHandle();

  AsyncCommandHandle(const AsyncCommandHandle&) = delete;
  AsyncCommandHandle& operator=(const AsyncCommandHandle&) = delete;

  const std::string& DisplayName() const noexcept { return display_name_; }

  // Forwards a line to the sink tagged with the display name.
  void Output(std::string_view line) const;

  // Runs `work` on a background thread. Only the first call has any effect.
  void Start(Work work);
  bool Started() const;

  // Waits for the work; rethrows whatever it threw. May be called repeatedly.
  void Join();

 private:
  std::string display_name_;
  OutputSink sink_;
  mutable std::mutex mutex_;
  std::thread thread_;
  std::shared_future<void> result_;
};

struct AsyncCommandResult {
  std::string display_name;
  bool succeeded{true};
  std::string error_message;
  std::exception_ptr error;
};

class AsyncCommandLedger;

// Proof that an AsyncCommandLedger was drained. Only JoinAll creates one.
class LedgerDrained {
 public:
  LedgerDrained(LedgerDrained&&) noexcept = default;
  LedgerDrained& operator=(LedgerDrained&&) noexcept = default;
  LedgerDrained(const LedgerDrained&) = delete;
  LedgerDrained& operator=(const LedgerDrained&) = delete;

  const std::vector<AsyncCommandResult>& Results() const noexcept { return results_; }
  size_t FailureCount() const noexcept;
  bool AllSucceeded() const noexcept { return FailureCount() == 0; }
  const AsyncCommandLedger* Ledger() const noexcept { return ledger_; }

 private:
  friend class AsyncCommandLedger;
  LedgerDrained(const AsyncCommandLedger* ledger, std::vector<AsyncCommandResult> results)
      : ledger_(ledger), results_(std::move(results)) {}

  const AsyncCommandLedger* ledger_;
  std::vector<AsyncCommandResult> results_;
};

// Per-job list of background commands; every entry is awaited by JoinAll.
class AsyncCommandLedger {
 public:
  AsyncCommandLedger() = default;
  AsyncCommandLedger(const AsyncCommandLedger&) = delete;
  AsyncCommandLedger& operator=(const AsyncCommandLedger&) = delete;

  // Throws Error{State} once the ledger has been drained.
  void Add(std::shared_ptr<AsyncCommandHandle> handle);
  size_t Size() const;
  bool Drained() const;

  // Awaits every entry, including entries added while draining, and reports
  // each outcome. Failures are collected, not rethrown.
  LedgerDrained JoinAll();

 private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<AsyncCommandHandle>> handles_;
  bool drained_{false};
};

} // namespace pw::orchestrator
