#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace pw::orchestrator {

// Capability set of a pipeline-step plugin.
class TaskPlugin {
 public:
  virtual ~TaskPlugin() = default;
  virtual std::string Id() const = 0;
  virtual std::string Stage() const = 0;
};

// Capability set of a log-stream command handler.
class CommandPlugin {
 public:
  virtual ~CommandPlugin() = default;
  virtual std::string Area() const = 0;
  virtual std::string Event() const = 0;
  virtual std::string DisplayName() const = 0;
};

// "<qualified type name>[, <module name>]"
struct TypeReference {
  std::string type_name;
  std::string module;

  static TypeReference Parse(std::string_view text);
};

// Where modules named by a type reference are looked up. Passed explicitly to
// each Resolve call; nothing is installed process-wide.
struct ResolutionContext {
  std::filesystem::path search_directory;
  std::set<std::string> loaded_modules;

  std::optional<std::filesystem::path> LocateModule(std::string_view module) const;
};

class ResolvedPlugin {
 public:
  ResolvedPlugin() = default;
  explicit ResolvedPlugin(std::unique_ptr<TaskPlugin> plugin) : plugin_(std::move(plugin)) {}
  explicit ResolvedPlugin(std::unique_ptr<CommandPlugin> plugin) : plugin_(std::move(plugin)) {}

  const TaskPlugin* AsTaskPlugin() const noexcept;
  const CommandPlugin* AsCommandPlugin() const noexcept;
  bool Empty() const noexcept;

 private:
  std::variant<std::monostate, std::unique_ptr<TaskPlugin>, std::unique_ptr<CommandPlugin>> plugin_;
};

using PluginFactory = std::function<ResolvedPlugin()>;

class TypeResolver {
 public:
  // Name of the module the built-in plugin types are linked into.
  static constexpr std::string_view kBuiltinModule{"Pw.Plugins"};

  TypeResolver() = default;

  static TypeResolver WithBuiltins();
  static ResolutionContext DefaultContext(std::filesystem::path search_directory);

  void RegisterFactory(std::string type_name, PluginFactory factory);
  bool HasFactory(std::string_view type_name) const;

  // Throws RegistrationFailure on any failure; never returns an empty plugin.
  ResolvedPlugin Resolve(std::string_view type_reference, const ResolutionContext& context) const;

 private:
  std::unordered_map<std::string, PluginFactory> factories_;
};

} // namespace pw::orchestrator
