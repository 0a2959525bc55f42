#include "pw/orchestrator/plugin_registry.h"

#include "pw/common.h"
#include "pw/error.h"
#include "pw/errors.h"
#include "pw/orchestrator/event_bus.h"

namespace pw::orchestrator {

namespace {

void RequireNonEmpty(const std::string& value, std::string_view message) {
  if (value.empty()) {
    throw RegistrationFailure(errors::config::kInvalidDescriptor, std::string(message));
  }
}

void PublishRegistered(std::string_view event_id, std::string_view message,
                       std::vector<EventField> fields) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = std::string(event_id);
  event.message = std::string(message);
  event.fields = std::move(fields);
  PublishEvent(event);
}

} // namespace

void PluginRegistry::EnsureWritable() const {
  if (sealed_) {
    throw Error(ErrorDomain::State, errors::state::kRegistrySealed,
                std::string(errors::msg::kRegistrySealed));
  }
}

void PluginRegistry::RegisterTaskPlugin(TaskPluginDescriptor descriptor) {
  EnsureWritable();
  RequireNonEmpty(descriptor.id, errors::msg::kEmptyTaskId);
  RequireNonEmpty(descriptor.stage, errors::msg::kEmptyStage);
  RequireNonEmpty(descriptor.type_reference, errors::msg::kEmptyTypeReference);

  tasks_[ToLowerAscii(descriptor.id)].push_back(descriptor.type_reference);
  known_task_types_.insert(descriptor.type_reference);
  task_descriptors_.push_back(std::move(descriptor));
}

void PluginRegistry::RegisterCommandPlugin(CommandPluginDescriptor descriptor) {
  EnsureWritable();
  RequireNonEmpty(descriptor.area, errors::msg::kEmptyArea);
  RequireNonEmpty(descriptor.event, errors::msg::kEmptyEvent);
  RequireNonEmpty(descriptor.display_name, errors::msg::kEmptyDisplayName);
  RequireNonEmpty(descriptor.type_reference, errors::msg::kEmptyTypeReference);

  auto key = std::make_pair(ToLowerAscii(descriptor.area), ToLowerAscii(descriptor.event));
  commands_[std::move(key)] = std::move(descriptor);  // last registration wins
}

std::optional<std::vector<std::string>> PluginRegistry::LookupTaskPlugins(std::string_view id) const {
  auto it = tasks_.find(ToLowerAscii(id));
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<CommandPluginDescriptor> PluginRegistry::LookupCommandPlugin(std::string_view area,
                                                                           std::string_view event) const {
  auto it = commands_.find(std::make_pair(ToLowerAscii(area), ToLowerAscii(event)));
  if (it == commands_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool PluginRegistry::IsKnownTaskPlugin(std::string_view type_reference) const {
  return known_task_types_.count(std::string(type_reference)) != 0;
}

std::vector<CommandPluginDescriptor> PluginRegistry::CommandPlugins() const {
  std::vector<CommandPluginDescriptor> out;
  out.reserve(commands_.size());
  for (const auto& [key, descriptor] : commands_) {
    out.push_back(descriptor);
  }
  return out;
}

PluginRegistry PopulateRegistry(const PluginCatalog& catalog, const TypeResolver& resolver,
                                const ResolutionContext& context) {
  PluginRegistry registry;

  for (const auto& type_reference : catalog.task_plugins) {
    auto resolved = resolver.Resolve(type_reference, context);
    const TaskPlugin* plugin = resolved.AsTaskPlugin();
    if (!plugin) {
      throw RegistrationFailure(errors::config::kCapabilityMismatch,
                                std::string(errors::msg::kNotATaskPlugin) + ": '" + type_reference + "'");
    }
    TaskPluginDescriptor descriptor{plugin->Id(), plugin->Stage(), type_reference};
    PublishRegistered("task_plugin_loaded", "Loaded task plugin",
                      {{"id", descriptor.id}, {"stage", descriptor.stage},
                       {"type_reference", descriptor.type_reference}});
    registry.RegisterTaskPlugin(std::move(descriptor));
  }

  for (const auto& type_reference : catalog.command_plugins) {
    auto resolved = resolver.Resolve(type_reference, context);
    const CommandPlugin* plugin = resolved.AsCommandPlugin();
    if (!plugin) {
      throw RegistrationFailure(errors::config::kCapabilityMismatch,
                                std::string(errors::msg::kNotACommandPlugin) + ": '" + type_reference + "'");
    }
    CommandPluginDescriptor descriptor{plugin->Area(), plugin->Event(), type_reference,
                                       plugin->DisplayName()};
    PublishRegistered("command_plugin_loaded", "Loaded command plugin",
                      {{"command", "##vso[" + descriptor.area + "." + descriptor.event + "]"},
                       {"type_reference", descriptor.type_reference}});
    registry.RegisterCommandPlugin(std::move(descriptor));
  }

  registry.Seal();
  return registry;
}

} // namespace pw::orchestrator
