#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pw/orchestrator/command.h"
#include "pw/orchestrator/command_dispatcher.h"
#include "pw/orchestrator/job_context.h"
#include "pw/orchestrator/plugin_host.h"
#include "pw/orchestrator/plugin_registry.h"

namespace pw::orchestrator {

// Worker-facing entry point for plugin execution.
class PluginManager {
public:
  PluginManager(PluginRegistry registry, PluginHost host);

  PluginManager(const PluginManager&) = delete;
  PluginManager& operator=(const PluginManager&) = delete;
  PluginManager(PluginManager&&) = delete;
  PluginManager& operator=(PluginManager&&) = delete;

  // Populates the built-in catalog against `layout.bin_directory` and checks
  // the helper. Throws RegistrationFailure or HelperMissingError.
  static std::unique_ptr<PluginManager> CreateDefault(HostLayout layout);

  std::optional<std::vector<std::string>> GetTaskPlugins(std::string_view task_id) const;
  std::optional<CommandPluginDescriptor> GetCommandPlugin(std::string_view area,
                                                          std::string_view event) const;

  // Runs a registered task plugin in task mode. Unregistered type references
  // raise UnsupportedPluginError before anything is spawned.
  void RunPluginTask(JobContext& job, const std::string& type_reference, const StringMap& inputs,
                     const StringMap& environment, const platform::LineObserver& observer) const;

  std::shared_ptr<AsyncCommandHandle> ProcessCommand(JobContext& job, const Command& command) const;

  const PluginRegistry& Registry() const noexcept { return registry_; }
  const PluginHost& Host() const noexcept { return host_; }

private:
  PluginRegistry registry_;
  PluginHost host_;
  CommandDispatcher dispatcher_;
};

} // namespace pw::orchestrator
