#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pw/orchestrator/async_command.h"
#include "pw/orchestrator/execution_context.h"
#include "pw/platform/cancellation.h"

namespace pw::orchestrator {

// Job state a plugin invocation draws from.
struct JobEnvironment {
  std::vector<RepositoryResource> repositories;
  std::vector<ServiceEndpoint> endpoints;
  std::optional<ContainerInfo> step_target;
  StringMap job_settings;
  VariableMap variables;
  VariableMap task_variables;
};

// Running job. Environment accessors belong to the job's main thread; output
// and the async-command ledger are safe to use from background commands.
class JobContext {
 public:
  explicit JobContext(JobEnvironment environment = {}, OutputSink sink = {},
                      platform::CancellationToken token = {});
  ~JobContext() = default;

  JobContext(const JobContext&) = delete;
  JobContext& operator=(const JobContext&) = delete;

  JobEnvironment& Environment() noexcept { return environment_; }
  const JobEnvironment& Environment() const noexcept { return environment_; }

  const platform::CancellationToken& Token() const noexcept { return token_; }

  // Serialized through one mutex so lines from concurrent commands never
  // interleave mid-line.
  void Output(std::string_view source, std::string_view line);
  OutputSink Sink();

  AsyncCommandLedger& AsyncCommands() noexcept { return ledger_; }

  // Finishes the job. The receipt must come from this job's ledger and a job
  // completes once; both are Error{State} otherwise. Returns true when every
  // async command succeeded.
  bool Complete(LedgerDrained receipt);
  bool Completed() const noexcept { return completed_; }

 private:
  JobEnvironment environment_;
  OutputSink sink_;
  platform::CancellationToken token_;
  std::mutex output_mutex_;
  bool completed_{false};
  // Declared last: destroyed first, so running commands finish while the sink
  // is still alive.
  AsyncCommandLedger ledger_;
};

} // namespace pw::orchestrator
