#include "pw/orchestrator/plugin_manager.h"

#include "pw/error.h"
#include "pw/errors.h"
#include "pw/orchestrator/event_bus.h"
#include "pw/orchestrator/type_resolver.h"

namespace pw::orchestrator {

PluginManager::PluginManager(PluginRegistry registry, PluginHost host)
    : registry_(std::move(registry)), host_(std::move(host)), dispatcher_(registry_, host_) {}

std::unique_ptr<PluginManager> PluginManager::CreateDefault(HostLayout layout) {
  const auto resolver = TypeResolver::WithBuiltins();
  const auto context = TypeResolver::DefaultContext(layout.bin_directory);
  auto registry = PopulateRegistry(PluginCatalog::Builtin(), resolver, context);
  PluginHost host(std::move(layout));
  return std::make_unique<PluginManager>(std::move(registry), std::move(host));
}

std::optional<std::vector<std::string>> PluginManager::GetTaskPlugins(std::string_view task_id) const {
  return registry_.LookupTaskPlugins(task_id);
}

std::optional<CommandPluginDescriptor> PluginManager::GetCommandPlugin(std::string_view area,
                                                                       std::string_view event) const {
  return registry_.LookupCommandPlugin(area, event);
}

void PluginManager::RunPluginTask(JobContext& job, const std::string& type_reference, const StringMap& inputs,
                                  const StringMap& environment,
                                  const platform::LineObserver& observer) const {
  if (type_reference.empty()) {
    throw Error(ErrorDomain::Validation, errors::validation::kEmptyArgument,
                std::string(errors::msg::kEmptyTypeReference));
  }
  // Only plugins from the registry may run.
  if (!registry_.IsKnownTaskPlugin(type_reference)) {
    throw UnsupportedPluginError(errors::validation::kUnsupportedTaskPlugin,
                                 std::string(errors::msg::kUnsupportedTaskPlugin) + ": " + type_reference);
  }

  const auto& env = job.Environment();
  TaskExecutionContext context;
  context.inputs = inputs;
  context.repositories = env.repositories;
  context.endpoints = env.endpoints;
  context.container = env.step_target;
  context.job_settings = env.job_settings;
  context.variables = env.variables;
  context.task_variables = env.task_variables;

  InvocationRequest request;
  request.mode = InvocationMode::kTask;
  request.type_reference = type_reference;
  request.input_document = SerializeTaskContext(context);
  request.environment = environment;

  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "task_plugin_run";
  event.message = "Running task plugin";
  event.fields.emplace_back("type_reference", type_reference);
  PublishEvent(event);

  host_.Invoke(request, observer, job.Token());
}

std::shared_ptr<AsyncCommandHandle> PluginManager::ProcessCommand(JobContext& job, const Command& command) const {
  return dispatcher_.Dispatch(job, command);
}

} // namespace pw::orchestrator
