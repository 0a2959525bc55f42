#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pw::orchestrator {

using StringMap = std::map<std::string, std::string>;

struct VariableValue {
  std::string value;
  bool is_secret{false};
  bool is_read_only{false};
};

using VariableMap = std::map<std::string, VariableValue>;

struct RepositoryResource {
  std::string alias;
  std::string type;
  std::string url;
  std::string version;
  StringMap properties;
};

struct EndpointAuthorization {
  std::string scheme;
  StringMap parameters;
};

struct ServiceEndpoint {
  std::string id;
  std::string name;
  std::string type;
  std::string url;
  EndpointAuthorization authorization;
  StringMap data;
};

struct ContainerInfo {
  std::string name;
  std::string image;
  std::string container_id;
  StringMap environment;
};

// Input document of a task-mode invocation. Serialized once, then discarded.
struct TaskExecutionContext {
  StringMap inputs;
  std::vector<RepositoryResource> repositories;
  std::vector<ServiceEndpoint> endpoints;
  std::optional<ContainerInfo> container;
  StringMap job_settings;
  VariableMap variables;
  VariableMap task_variables;
};

// Input document of a command-mode invocation.
struct CommandExecutionContext {
  std::string data;
  StringMap properties;
  std::vector<ServiceEndpoint> endpoints;
  VariableMap variables;
};

std::string SerializeTaskContext(const TaskExecutionContext& context);
std::string SerializeCommandContext(const CommandExecutionContext& context);

} // namespace pw::orchestrator
