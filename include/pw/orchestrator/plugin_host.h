#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pw/crypto/sha256.h"
#include "pw/orchestrator/execution_context.h"
#include "pw/platform/cancellation.h"
#include "pw/platform/line_channel.h"
#include "pw/platform/process_invoker.h"

namespace pw::orchestrator {

enum class InvocationMode { kTask, kCommand };

std::string_view ToString(InvocationMode mode) noexcept;

// Where the helper executable lives and where it runs.
struct HostLayout {
  std::filesystem::path bin_directory;
  std::filesystem::path work_directory;
  std::string helper_name{"pw-plugin-host"};
  std::optional<std::string> helper_sha256;  // hex; pins the helper binary when set

  std::filesystem::path HelperPath() const;

  // PW_BIN_DIR, PW_WORK_DIR, PW_PLUGIN_HOST, PW_PLUGIN_HOST_SHA256; unset
  // values fall back to the executable's directory, <cwd>/_work and the
  // default helper name.
  static HostLayout FromEnvironment();
};

struct OutcomeClassification {
  enum class Kind { kSucceeded, kProcessFault, kLogicalFailure };

  Kind kind{Kind::kSucceeded};
  int exit_code{0};
  std::string error_text;

  bool Succeeded() const noexcept { return kind == Kind::kSucceeded; }
};

// Only exit code 0 is acceptable.
OutcomeClassification ClassifyTaskOutcome(int exit_code);
// Exit code 0 is required but not sufficient: any stderr output is a logical
// failure.
OutcomeClassification ClassifyCommandOutcome(int exit_code, const std::vector<std::string>& stderr_lines);

struct InvocationRequest {
  InvocationMode mode{InvocationMode::kTask};
  std::string type_reference;
  std::string input_document;
  std::optional<StringMap> environment;
};

// Runs plugins out of process through the helper executable.
class PluginHost {
 public:
  // Throws HelperMissingError when the helper is absent or fails its pin.
  explicit PluginHost(HostLayout layout, platform::ProcessInvoker invoker = platform::ProcessInvoker());

  const HostLayout& Layout() const noexcept { return layout_; }
  const std::filesystem::path& HelperPath() const noexcept { return helper_path_; }

  // Spawns the helper and classifies the outcome without raising on fault.
  OutcomeClassification Run(const InvocationRequest& request, const platform::LineObserver& observer,
                            const platform::CancellationToken& token) const;

  // Like Run, but a fault raises ProcessFaultError and a logical failure
  // raises LogicalFailureError.
  void Invoke(const InvocationRequest& request, const platform::LineObserver& observer,
              const platform::CancellationToken& token) const;

  // Display form of the helper arguments: mode "type-reference".
  static std::string DisplayArguments(InvocationMode mode, std::string_view type_reference);

 private:
  void VerifyHelper() const;
  void RequireWorkDirectory() const;

  HostLayout layout_;
  std::filesystem::path helper_path_;
  std::optional<crypto::Sha256Digest> pinned_digest_;
  platform::ProcessInvoker invoker_;
};

} // namespace pw::orchestrator
