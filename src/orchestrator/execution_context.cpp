#include "pw/orchestrator/execution_context.h"

#include "pw/codec/json_writer.h"

namespace pw::orchestrator {

namespace {

using codec::JsonWriter;

void WriteStringMap(JsonWriter& json, const StringMap& values) {
  json.BeginObject();
  for (const auto& [name, value] : values) {
    json.Key(name).String(value);
  }
  json.EndObject();
}

void WriteVariables(JsonWriter& json, const VariableMap& variables) {
  json.BeginObject();
  for (const auto& [name, variable] : variables) {
    json.Key(name).BeginObject();
    json.Key("value").String(variable.value);
    json.Key("isSecret").Bool(variable.is_secret);
    json.Key("isReadOnly").Bool(variable.is_read_only);
    json.EndObject();
  }
  json.EndObject();
}

void WriteRepositories(JsonWriter& json, const std::vector<RepositoryResource>& repositories) {
  json.BeginArray();
  for (const auto& repo : repositories) {
    json.BeginObject();
    json.Key("alias").String(repo.alias);
    json.Key("type").String(repo.type);
    json.Key("url").String(repo.url);
    json.Key("version").String(repo.version);
    json.Key("properties");
    WriteStringMap(json, repo.properties);
    json.EndObject();
  }
  json.EndArray();
}

void WriteEndpoints(JsonWriter& json, const std::vector<ServiceEndpoint>& endpoints) {
  json.BeginArray();
  for (const auto& endpoint : endpoints) {
    json.BeginObject();
    json.Key("id").String(endpoint.id);
    json.Key("name").String(endpoint.name);
    json.Key("type").String(endpoint.type);
    json.Key("url").String(endpoint.url);
    json.Key("authorization").BeginObject();
    json.Key("scheme").String(endpoint.authorization.scheme);
    json.Key("parameters");
    WriteStringMap(json, endpoint.authorization.parameters);
    json.EndObject();
    json.Key("data");
    WriteStringMap(json, endpoint.data);
    json.EndObject();
  }
  json.EndArray();
}

void WriteContainer(JsonWriter& json, const std::optional<ContainerInfo>& container) {
  if (!container) {
    json.Null();
    return;
  }
  json.BeginObject();
  json.Key("name").String(container->name);
  json.Key("image").String(container->image);
  json.Key("id").String(container->container_id);
  json.Key("environment");
  WriteStringMap(json, container->environment);
  json.EndObject();
}

} // namespace

std::string SerializeTaskContext(const TaskExecutionContext& context) {
  JsonWriter json;
  json.BeginObject();
  json.Key("inputs");
  WriteStringMap(json, context.inputs);
  json.Key("repositories");
  WriteRepositories(json, context.repositories);
  json.Key("endpoints");
  WriteEndpoints(json, context.endpoints);
  json.Key("container");
  WriteContainer(json, context.container);
  json.Key("jobSettings");
  WriteStringMap(json, context.job_settings);
  json.Key("variables");
  WriteVariables(json, context.variables);
  json.Key("taskVariables");
  WriteVariables(json, context.task_variables);
  json.EndObject();
  return json.Take();
}

std::string SerializeCommandContext(const CommandExecutionContext& context) {
  JsonWriter json;
  json.BeginObject();
  json.Key("data").String(context.data);
  json.Key("properties");
  WriteStringMap(json, context.properties);
  json.Key("endpoints");
  WriteEndpoints(json, context.endpoints);
  json.Key("variables");
  WriteVariables(json, context.variables);
  json.EndObject();
  return json.Take();
}

} // namespace pw::orchestrator
