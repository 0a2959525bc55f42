#include "pw/orchestrator/type_resolver.h"

#include <system_error>

#include "pw/common.h"
#include "pw/error.h"
#include "pw/errors.h"
#include "pw/orchestrator/event_bus.h"

namespace pw::orchestrator {

namespace {

std::string_view Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

[[noreturn]] void ThrowResolution(int code, std::string_view message, std::string_view type_reference) {
  throw RegistrationFailure(code, std::string(message) + ": '" + std::string(type_reference) + "'");
}

} // namespace

TypeReference TypeReference::Parse(std::string_view text) {
  TypeReference ref;
  const auto comma = text.find(',');
  ref.type_name = std::string(Trim(text.substr(0, comma)));
  if (comma != std::string_view::npos) {
    ref.module = std::string(Trim(text.substr(comma + 1)));
    if (ref.module.empty()) {
      ThrowResolution(errors::config::kMalformedTypeReference, errors::msg::kMalformedTypeReference, text);
    }
  }
  if (ref.type_name.empty()) {
    ThrowResolution(errors::config::kMalformedTypeReference, errors::msg::kMalformedTypeReference, text);
  }
  return ref;
}

std::optional<std::filesystem::path> ResolutionContext::LocateModule(std::string_view module) const {
  if (search_directory.empty() || module.empty()) {
    return std::nullopt;
  }
  auto candidate = search_directory / (std::string(module) + std::string(ModuleExtension()));
  std::error_code ec;
  if (std::filesystem::is_regular_file(candidate, ec) && !ec) {
    return candidate;
  }
  return std::nullopt;
}

const TaskPlugin* ResolvedPlugin::AsTaskPlugin() const noexcept {
  if (auto* plugin = std::get_if<std::unique_ptr<TaskPlugin>>(&plugin_)) {
    return plugin->get();
  }
  return nullptr;
}

const CommandPlugin* ResolvedPlugin::AsCommandPlugin() const noexcept {
  if (auto* plugin = std::get_if<std::unique_ptr<CommandPlugin>>(&plugin_)) {
    return plugin->get();
  }
  return nullptr;
}

bool ResolvedPlugin::Empty() const noexcept {
  return AsTaskPlugin() == nullptr && AsCommandPlugin() == nullptr;
}

ResolutionContext TypeResolver::DefaultContext(std::filesystem::path search_directory) {
  ResolutionContext context;
  context.search_directory = std::move(search_directory);
  context.loaded_modules.insert(std::string(kBuiltinModule));
  return context;
}

void TypeResolver::RegisterFactory(std::string type_name, PluginFactory factory) {
  factories_[std::move(type_name)] = std::move(factory);
}

bool TypeResolver::HasFactory(std::string_view type_name) const {
  return factories_.find(std::string(type_name)) != factories_.end();
}

ResolvedPlugin TypeResolver::Resolve(std::string_view type_reference,
                                     const ResolutionContext& context) const {
  if (Trim(type_reference).empty()) {
    ThrowResolution(errors::config::kMalformedTypeReference, errors::msg::kEmptyTypeReference, type_reference);
  }
  const auto ref = TypeReference::Parse(type_reference);

  if (!ref.module.empty() && context.loaded_modules.count(ref.module) == 0) {
    auto located = context.LocateModule(ref.module);
    if (!located) {
      ThrowResolution(errors::config::kModuleNotFound, errors::msg::kModuleNotFound, type_reference);
    }
    Event event;
    event.category = EventCategory::kLifecycle;
    event.severity = EventSeverity::kDebug;
    event.event_id = "plugin_module_located";
    event.message = "Resolved plugin module from search directory";
    event.fields.emplace_back("module", ref.module);
    event.fields.emplace_back("module_path", PathToUtf8String(*located), FieldPrivacy::kHash);
    PublishEvent(event);
  }

  auto it = factories_.find(ref.type_name);
  if (it == factories_.end() || !it->second) {
    ThrowResolution(errors::config::kTypeNotFound, errors::msg::kTypeNotFound, type_reference);
  }

  ResolvedPlugin resolved;
  try {
    resolved = it->second();
  } catch (const RegistrationFailure&) {
    throw;
  } catch (const std::exception& ex) {
    throw RegistrationFailure(errors::config::kInstantiationFailed,
                              std::string(errors::msg::kFactoryThrew) + ": '" +
                                  std::string(type_reference) + "': " + ex.what());
  }
  if (resolved.Empty()) {
    ThrowResolution(errors::config::kInstantiationFailed, errors::msg::kFactoryReturnedNothing, type_reference);
  }
  return resolved;
}

} // namespace pw::orchestrator
