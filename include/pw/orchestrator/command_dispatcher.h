#pragma once
#include <memory>

#include "pw/orchestrator/async_command.h"
#include "pw/orchestrator/command.h"
#include "pw/orchestrator/job_context.h"
#include "pw/orchestrator/plugin_host.h"
#include "pw/orchestrator/plugin_registry.h"

namespace pw::orchestrator {

// Routes command markers to command plugins running in the background. The
// registry and host must outlive every job the dispatcher has touched.
class CommandDispatcher {
 public:
  CommandDispatcher(const PluginRegistry& registry, const PluginHost& host)
      : registry_(registry), host_(host) {}

  // Throws UnsupportedPluginError when no plugin handles (area, event); no
  // process is spawned and the ledger is unchanged in that case. Otherwise the
  // returned handle is already on the job's ledger and running.
  std::shared_ptr<AsyncCommandHandle> Dispatch(JobContext& job, const Command& command) const;

 private:
  const PluginRegistry& registry_;
  const PluginHost& host_;
};

} // namespace pw::orchestrator
