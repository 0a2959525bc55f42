#include "pw/orchestrator/job_context.h"

#include "pw/error.h"
#include "pw/errors.h"
#include "pw/orchestrator/event_bus.h"

namespace pw::orchestrator {

JobContext::JobContext(JobEnvironment environment, OutputSink sink, platform::CancellationToken token)
    : environment_(std::move(environment)), sink_(std::move(sink)), token_(std::move(token)) {}

void JobContext::Output(std::string_view source, std::string_view line) {
  std::lock_guard<std::mutex> guard(output_mutex_);
  if (sink_) {
    sink_(source, line);
  }
}

OutputSink JobContext::Sink() {
  return [this](std::string_view source, std::string_view line) { Output(source, line); };
}

bool JobContext::Complete(LedgerDrained receipt) {
  if (receipt.Ledger() != &ledger_) {
    throw Error(ErrorDomain::State, errors::state::kLedgerDrained,
                "Drained receipt belongs to a different job");
  }
  if (completed_) {
    throw Error(ErrorDomain::State, errors::state::kJobCompleted, std::string(errors::msg::kJobAlreadyCompleted));
  }
  completed_ = true;
  const bool succeeded = receipt.AllSucceeded();

  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = succeeded ? EventSeverity::kInfo : EventSeverity::kWarning;
  event.event_id = "job_completed";
  event.message = "Job completed";
  event.fields.emplace_back("async_commands", std::to_string(receipt.Results().size()),
                            FieldPrivacy::kPublic, true);
  event.fields.emplace_back("failed_async_commands", std::to_string(receipt.FailureCount()),
                            FieldPrivacy::kPublic, true);
  PublishEvent(event);
  return succeeded;
}

} // namespace pw::orchestrator
