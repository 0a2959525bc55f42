#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "pw/orchestrator/type_resolver.h"

namespace pw::orchestrator {

struct TaskPluginDescriptor {
  std::string id;
  std::string stage;
  std::string type_reference;
};

struct CommandPluginDescriptor {
  std::string area;
  std::string event;
  std::string type_reference;
  std::string display_name;
};

// Type references to load at startup, in registration order.
struct PluginCatalog {
  std::vector<std::string> task_plugins;
  std::vector<std::string> command_plugins;

  static PluginCatalog Builtin();
};

// Static catalog of task and command plugins. Written only during population,
// read-only once sealed.
class PluginRegistry {
 public:
  void RegisterTaskPlugin(TaskPluginDescriptor descriptor);
  void RegisterCommandPlugin(CommandPluginDescriptor descriptor);

  // nullopt for an unknown id; otherwise every type reference registered under
  // the id, in registration order.
  std::optional<std::vector<std::string>> LookupTaskPlugins(std::string_view id) const;
  std::optional<CommandPluginDescriptor> LookupCommandPlugin(std::string_view area,
                                                             std::string_view event) const;
  bool IsKnownTaskPlugin(std::string_view type_reference) const;

  void Seal() noexcept { sealed_ = true; }
  bool Sealed() const noexcept { return sealed_; }

  const std::vector<TaskPluginDescriptor>& TaskPlugins() const noexcept { return task_descriptors_; }
  std::vector<CommandPluginDescriptor> CommandPlugins() const;

 private:
  void EnsureWritable() const;

  // Task ids are GUIDs; keys are stored lowercased.
  std::map<std::string, std::vector<std::string>> tasks_;
  std::vector<TaskPluginDescriptor> task_descriptors_;
  std::unordered_set<std::string> known_task_types_;
  std::map<std::pair<std::string, std::string>, CommandPluginDescriptor> commands_;
  bool sealed_{false};
};

// Resolves every catalog entry and returns a sealed registry. Any failure
// aborts population with RegistrationFailure.
PluginRegistry PopulateRegistry(const PluginCatalog& catalog, const TypeResolver& resolver,
                                const ResolutionContext& context);

} // namespace pw::orchestrator
