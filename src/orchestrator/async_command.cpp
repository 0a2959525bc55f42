#include "pw/orchestrator/async_command.h"

#include <algorithm>
#include <utility>

#include "pw/error.h"
#include "pw/errors.h"
#include "pw/orchestrator/event_bus.h"

namespace pw::orchestrator {

AsyncCommandHandle::AsyncCommandHandle(std::string display_name, OutputSink sink)
    : display_name_(std::move(display_name)), sink_(std::move(sink)) {}

AsyncCommandHandle::~AsyncCommandHandle() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (thread_.joinable()) {
    thread_.join();
  }
}

void AsyncCommandHandle::Output(std::string_view line) const {
  if (sink_) {
    sink_(display_name_, line);
  }
}

void AsyncCommandHandle::Start(Work work) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (result_.valid()) {
    return;
  }
  std::packaged_task<void()> task([this, work = std::move(work)]() { work(*this); });
  result_ = task.get_future().share();
  thread_ = std::thread(std::move(task));
}

bool AsyncCommandHandle::Started() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return result_.valid();
}

void AsyncCommandHandle::Join() {
  std::shared_future<void> result;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (thread_.joinable()) {
      thread_.join();
    }
    result = result_;
  }
  if (result.valid()) {
    result.get();
  }
}

size_t LedgerDrained::FailureCount() const noexcept {
  return static_cast<size_t>(std::count_if(results_.begin(), results_.end(),
                                           [](const AsyncCommandResult& r) { return !r.succeeded; }));
}

void AsyncCommandLedger::Add(std::shared_ptr<AsyncCommandHandle> handle) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (drained_) {
    throw Error(ErrorDomain::State, errors::state::kLedgerDrained,
                std::string(errors::msg::kLedgerAlreadyDrained));
  }
  handles_.push_back(std::move(handle));
}

size_t AsyncCommandLedger::Size() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return handles_.size();
}

bool AsyncCommandLedger::Drained() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return drained_;
}

LedgerDrained AsyncCommandLedger::JoinAll() {
  std::vector<AsyncCommandResult> results;
  for (size_t index = 0;; ++index) {
    std::shared_ptr<AsyncCommandHandle> handle;
    {
      std::lock_guard<std::mutex> guard(mutex_);
      if (index >= handles_.size()) {
        drained_ = true;
        break;
      }
      handle = handles_[index];
    }

    AsyncCommandResult result;
    result.display_name = handle->DisplayName();
    try {
      handle->Join();
    } catch (const std::exception& ex) {
      result.succeeded = false;
      result.error_message = ex.what();
      result.error = std::current_exception();
    }

    Event event;
    event.category = EventCategory::kLifecycle;
    event.severity = result.succeeded ? EventSeverity::kInfo : EventSeverity::kError;
    event.event_id = "async_command_joined";
    event.message = result.succeeded ? "Async command completed" : "Async command failed";
    event.fields.emplace_back("display_name", result.display_name);
    if (!result.succeeded) {
      event.fields.emplace_back("error", result.error_message);
    }
    PublishEvent(event);

    results.push_back(std::move(result));
  }
  return LedgerDrained(this, std::move(results));
}

} // namespace pw::orchestrator
