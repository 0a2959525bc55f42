#include <memory>
#include <string>
#include <string_view>

#include "pw/orchestrator/plugin_registry.h"
#include "pw/orchestrator/type_resolver.h"

namespace pw::orchestrator {

namespace {

constexpr std::string_view kCheckoutTaskId{"c61807ba-5e20-4b70-bd8c-3683c9f74003"};
constexpr std::string_view kDownloadArtifactTaskId{"61f2a582-95ae-4948-b34d-a1b3c4f6a737"};
constexpr std::string_view kPublishArtifactTaskId{"ecdc45f6-832d-4ad9-b52b-ee49e94659be"};
constexpr std::string_view kPipelineCacheTaskId{"D53CCAB4-555E-4494-9D06-11DB043FB4A9"};

struct BuiltinTaskType {
  std::string_view type_name;
  std::string_view id;
  std::string_view stage;
};

// Registration order is significant: later entries for an id are newer
// versions of the same task.
constexpr BuiltinTaskType kBuiltinTaskTypes[] = {
    {"Pw.Plugins.Repository.CheckoutTask", kCheckoutTaskId, "main"},
    {"Pw.Plugins.Repository.CleanupTask", kCheckoutTaskId, "post"},
    {"Pw.Plugins.PipelineArtifact.DownloadPipelineArtifactTask", kDownloadArtifactTaskId, "main"},
    {"Pw.Plugins.PipelineArtifact.PublishPipelineArtifactTask", kPublishArtifactTaskId, "main"},
    {"Pw.Plugins.PipelineArtifact.PublishPipelineArtifactTaskV1", kPublishArtifactTaskId, "main"},
    {"Pw.Plugins.PipelineArtifact.DownloadPipelineArtifactTaskV1", kDownloadArtifactTaskId, "main"},
    {"Pw.Plugins.PipelineArtifact.DownloadPipelineArtifactTaskV1_1_0", kDownloadArtifactTaskId, "main"},
    {"Pw.Plugins.PipelineCache.SavePipelineCacheV0", kPipelineCacheTaskId, "post"},
    {"Pw.Plugins.PipelineCache.RestorePipelineCacheV0", kPipelineCacheTaskId, "main"},
    {"Pw.Plugins.PipelineArtifact.DownloadPipelineArtifactTaskV1_1_1", kDownloadArtifactTaskId, "main"},
    {"Pw.Plugins.PipelineArtifact.DownloadPipelineArtifactTaskV1_1_2", kDownloadArtifactTaskId, "main"},
    {"Pw.Plugins.PipelineArtifact.DownloadPipelineArtifactTaskV1_1_3", kDownloadArtifactTaskId, "main"},
    {"Pw.Plugins.PipelineArtifact.DownloadPipelineArtifactTaskV2_0_0", kDownloadArtifactTaskId, "main"},
    {"Pw.Plugins.PipelineArtifact.PublishPipelineArtifactTaskV0_140_0", kPublishArtifactTaskId, "main"},
};

// Descriptor-only stand-in for a plugin whose implementation runs inside the
// helper process.
class BuiltinTaskPlugin final : public TaskPlugin {
 public:
  explicit BuiltinTaskPlugin(const BuiltinTaskType& type) : type_(type) {}

  std::string Id() const override { return std::string(type_.id); }
  std::string Stage() const override { return std::string(type_.stage); }

 private:
  BuiltinTaskType type_;
};

std::string QualifiedReference(std::string_view type_name) {
  return std::string(type_name) + ", " + std::string(TypeResolver::kBuiltinModule);
}

} // namespace

TypeResolver TypeResolver::WithBuiltins() {
  TypeResolver resolver;
  for (const auto& type : kBuiltinTaskTypes) {
    resolver.RegisterFactory(std::string(type.type_name), [type]() {
      return ResolvedPlugin(std::unique_ptr<TaskPlugin>(std::make_unique<BuiltinTaskPlugin>(type)));
    });
  }
  return resolver;
}

PluginCatalog PluginCatalog::Builtin() {
  PluginCatalog catalog;
  for (const auto& type : kBuiltinTaskTypes) {
    catalog.task_plugins.push_back(QualifiedReference(type.type_name));
  }
  // No command plugins ship with the worker.
  return catalog;
}

} // namespace pw::orchestrator
