#include "pw/orchestrator/plugin_host.h"

#include <cstdlib>
#include <mutex>
#include <system_error>

#include "pw/common.h"
#include "pw/error.h"
#include "pw/errors.h"
#include "pw/orchestrator/event_bus.h"

namespace pw::orchestrator {

namespace {

std::optional<std::string> ReadEnv(const char* name) {
  const char* value = std::getenv(name);
  if (!value || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::filesystem::path ExecutableDirectory() {
  std::error_code ec;
  auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec && !self.empty()) {
    return self.parent_path();
  }
  return std::filesystem::current_path();
}

std::string JoinLines(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i != 0) {
      out.push_back('\n');
    }
    out += lines[i];
  }
  return out;
}

const char* KindToString(OutcomeClassification::Kind kind) {
  switch (kind) {
  case OutcomeClassification::Kind::kSucceeded:
    return "succeeded";
  case OutcomeClassification::Kind::kProcessFault:
    return "process_fault";
  case OutcomeClassification::Kind::kLogicalFailure:
    return "logical_failure";
  }
  return "unknown";
}

void PublishHostEvent(EventSeverity severity, std::string_view event_id, std::string_view message,
                      std::vector<EventField> fields) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = std::string(event_id);
  event.message = std::string(message);
  event.fields = std::move(fields);
  PublishEvent(event);
}

} // namespace

std::string_view ToString(InvocationMode mode) noexcept {
  switch (mode) {
  case InvocationMode::kTask:
    return "task";
  case InvocationMode::kCommand:
    return "command";
  }
  return "task";
}

std::filesystem::path HostLayout::HelperPath() const {
  return bin_directory / (helper_name + std::string(ExeExtension()));
}

HostLayout HostLayout::FromEnvironment() {
  HostLayout layout;
  if (auto bin = ReadEnv("PW_BIN_DIR")) {
    layout.bin_directory = *bin;
  } else {
    layout.bin_directory = ExecutableDirectory();
  }
  if (auto work = ReadEnv("PW_WORK_DIR")) {
    layout.work_directory = *work;
  } else {
    layout.work_directory = std::filesystem::current_path() / "_work";
  }
  if (auto helper = ReadEnv("PW_PLUGIN_HOST")) {
    layout.helper_name = *helper;
  }
  layout.helper_sha256 = ReadEnv("PW_PLUGIN_HOST_SHA256");
  return layout;
}

OutcomeClassification ClassifyTaskOutcome(int exit_code) {
  OutcomeClassification outcome;
  outcome.exit_code = exit_code;
  if (exit_code != 0) {
    outcome.kind = OutcomeClassification::Kind::kProcessFault;
  }
  return outcome;
}

OutcomeClassification ClassifyCommandOutcome(int exit_code, const std::vector<std::string>& stderr_lines) {
  OutcomeClassification outcome;
  outcome.exit_code = exit_code;
  if (exit_code != 0) {
    outcome.kind = OutcomeClassification::Kind::kProcessFault;
    outcome.error_text = JoinLines(stderr_lines);
  } else if (!stderr_lines.empty()) {
    outcome.kind = OutcomeClassification::Kind::kLogicalFailure;
    outcome.error_text = JoinLines(stderr_lines);
  }
  return outcome;
}

PluginHost::PluginHost(HostLayout layout, platform::ProcessInvoker invoker)
    : layout_(std::move(layout)), helper_path_(layout_.HelperPath()), invoker_(invoker) {
  if (layout_.helper_sha256) {
    pinned_digest_ = crypto::ParseSha256Hex(*layout_.helper_sha256);
    if (!pinned_digest_) {
      throw Error(ErrorDomain::Config, errors::config::kInvalidLayout,
                  "Helper SHA-256 pin is not a 64-character hex digest");
    }
  }
  VerifyHelper();
}

std::string PluginHost::DisplayArguments(InvocationMode mode, std::string_view type_reference) {
  return std::string(ToString(mode)) + " \"" + std::string(type_reference) + "\"";
}

void PluginHost::VerifyHelper() const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(helper_path_, ec) || ec) {
    PublishHostEvent(EventSeverity::kError, "plugin_host_missing", errors::msg::kHelperMissing,
                     {{"helper_path", PathToUtf8String(helper_path_)}});
    throw HelperMissingError(ErrorDomain::Dependency, errors::dependency::kHelperMissing,
                             std::string(errors::msg::kHelperMissing) + ": " + PathToUtf8String(helper_path_));
  }
  if (!pinned_digest_) {
    return;
  }
  const auto actual = crypto::SHA256_File(helper_path_);
  if (!crypto::DigestEquals(actual, *pinned_digest_)) {
    PublishHostEvent(EventSeverity::kCritical, "plugin_host_integrity_mismatch",
                     errors::msg::kHelperIntegrityMismatch,
                     {{"helper_path", PathToUtf8String(helper_path_)},
                      {"actual_sha256", crypto::HexEncode(actual)}});
    throw HelperMissingError(ErrorDomain::Security, errors::security::kHelperIntegrityMismatch,
                             std::string(errors::msg::kHelperIntegrityMismatch) + ": " +
                                 PathToUtf8String(helper_path_));
  }
}

void PluginHost::RequireWorkDirectory() const {
  std::error_code ec;
  if (!std::filesystem::is_directory(layout_.work_directory, ec) || ec) {
    throw HelperMissingError(ErrorDomain::Dependency, errors::dependency::kWorkDirectoryMissing,
                             std::string(errors::msg::kWorkDirectoryMissing) + ": " +
                                 PathToUtf8String(layout_.work_directory));
  }
}

OutcomeClassification PluginHost::Run(const InvocationRequest& request, const platform::LineObserver& observer,
                                      const platform::CancellationToken& token) const {
  if (request.type_reference.empty()) {
    throw Error(ErrorDomain::Validation, errors::validation::kEmptyArgument,
                std::string(errors::msg::kEmptyTypeReference));
  }
  RequireWorkDirectory();
  VerifyHelper();

  platform::ProcessStartInfo info;
  info.file = helper_path_;
  info.arguments = {std::string(ToString(request.mode)), request.type_reference};
  info.working_directory = layout_.work_directory;
  info.standard_input = request.input_document;
  if (request.mode == InvocationMode::kTask) {
    info.environment = request.environment;
  }

  std::mutex stderr_mutex;
  std::vector<std::string> stderr_lines;
  platform::LineObserver forward;
  if (request.mode == InvocationMode::kTask) {
    forward = observer;
  } else {
    forward = [&](const platform::OutputLine& line) {
      if (line.stream == platform::StreamKind::kStderr) {
        std::lock_guard<std::mutex> guard(stderr_mutex);
        stderr_lines.push_back(line.text);
        return;
      }
      if (observer) {
        observer(line);
      }
    };
  }

  PublishHostEvent(EventSeverity::kInfo, "plugin_spawn", "Starting plugin host",
                   {{"mode", std::string(ToString(request.mode))},
                    {"type_reference", request.type_reference}});
  const int exit_code = invoker_.Execute(info, forward, token);
  PublishHostEvent(EventSeverity::kDebug, "plugin_exit", "Plugin host exited",
                   {{"type_reference", request.type_reference},
                    EventField("exit_code", std::to_string(exit_code), FieldPrivacy::kPublic, true)});

  OutcomeClassification outcome;
  if (request.mode == InvocationMode::kTask) {
    outcome = ClassifyTaskOutcome(exit_code);
  } else {
    std::lock_guard<std::mutex> guard(stderr_mutex);
    outcome = ClassifyCommandOutcome(exit_code, stderr_lines);
  }
  PublishHostEvent(outcome.Succeeded() ? EventSeverity::kInfo : EventSeverity::kWarning, "plugin_outcome",
                   "Plugin invocation classified",
                   {{"type_reference", request.type_reference},
                    {"outcome", KindToString(outcome.kind)},
                    EventField("exit_code", std::to_string(exit_code), FieldPrivacy::kPublic, true)});
  return outcome;
}

void PluginHost::Invoke(const InvocationRequest& request, const platform::LineObserver& observer,
                        const platform::CancellationToken& token) const {
  const auto outcome = Run(request, observer, token);
  switch (outcome.kind) {
  case OutcomeClassification::Kind::kSucceeded:
    return;
  case OutcomeClassification::Kind::kProcessFault:
    if (request.mode == InvocationMode::kCommand && observer) {
      observer(platform::OutputLine{platform::StreamKind::kStderr, outcome.error_text});
    }
    throw ProcessFaultError(outcome.exit_code, PathToUtf8String(helper_path_),
                            DisplayArguments(request.mode, request.type_reference), outcome.error_text,
                            std::string(errors::msg::kExitCodeNonZero) + " (" +
                                std::to_string(outcome.exit_code) + "): " + PathToUtf8String(helper_path_) +
                                " " + DisplayArguments(request.mode, request.type_reference));
  case OutcomeClassification::Kind::kLogicalFailure:
    throw LogicalFailureError(outcome.error_text);
  }
}

} // namespace pw::orchestrator
