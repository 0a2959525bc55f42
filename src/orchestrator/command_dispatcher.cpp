#include "pw/orchestrator/command_dispatcher.h"

#include "pw/error.h"
#include "pw/errors.h"
#include "pw/orchestrator/event_bus.h"

namespace pw::orchestrator {

std::shared_ptr<AsyncCommandHandle> CommandDispatcher::Dispatch(JobContext& job, const Command& command) const {
  auto plugin = registry_.LookupCommandPlugin(command.area, command.event);
  if (!plugin) {
    throw UnsupportedPluginError(errors::validation::kUnsupportedCommand,
                                 std::string(errors::msg::kUnsupportedCommand) + ": " + command.ToString());
  }

  // Copied now: later changes to the job's variables must not reach the plugin.
  CommandExecutionContext context;
  context.data = command.data;
  context.properties = command.properties;
  context.endpoints = job.Environment().endpoints;
  context.variables = job.Environment().variables;

  InvocationRequest request;
  request.mode = InvocationMode::kCommand;
  request.type_reference = plugin->type_reference;
  request.input_document = SerializeCommandContext(context);

  auto handle = std::make_shared<AsyncCommandHandle>(plugin->display_name, job.Sink());
  job.AsyncCommands().Add(handle);

  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kDebug;
  event.event_id = "command_dispatched";
  event.message = "Processing command through plugin in background";
  event.fields.emplace_back("area", command.area);
  event.fields.emplace_back("event", command.event);
  event.fields.emplace_back("display_name", plugin->display_name);
  PublishEvent(event);

  const PluginHost& host = host_;
  platform::CancellationToken token = job.Token();
  handle->Start([&host, request = std::move(request), token](AsyncCommandHandle& self) {
    host.Invoke(request,
                [&self](const platform::OutputLine& line) { self.Output(line.text); },
                token);
  });
  return handle;
}

} // namespace pw::orchestrator
