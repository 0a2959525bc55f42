#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pw/error.h"
#include "pw/orchestrator/command.h"
#include "pw/orchestrator/event_bus.h"
#include "pw/orchestrator/job_context.h"
#include "pw/orchestrator/plugin_manager.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitFailure = 1;
  constexpr int kExitUsage = 64;

  void PrintUsage() {
    std::cerr << "pipeworker plugin runner\n";
    std::cerr << "Usage:\n";
    std::cerr << "  pw-worker [flags] list\n";
    std::cerr << "  pw-worker [flags] run-task <task-id> [--input=k=v]... [--env=k=v]...\n";
    std::cerr << "  pw-worker [flags] process-log <file|->\n";
    std::cerr << "\nGlobal flags:\n";
    std::cerr << "  --bin-dir=<dir>        Directory holding the plugin host (PW_BIN_DIR)\n";
    std::cerr << "  --work-dir=<dir>       Working directory for plugins (PW_WORK_DIR)\n";
    std::cerr << "  --helper=<name>        Plugin host executable name (PW_PLUGIN_HOST)\n";
    std::cerr << "  --helper-sha256=<hex>  Pin the plugin host binary (PW_PLUGIN_HOST_SHA256)\n";
  }

  std::string_view DomainPrefix(pw::ErrorDomain domain) {
    switch (domain) {
    case pw::ErrorDomain::IO:
      return "I/O error";
    case pw::ErrorDomain::Security:
      return "Security error";
    case pw::ErrorDomain::Process:
      return "Process error";
    case pw::ErrorDomain::Validation:
      return "Validation error";
    case pw::ErrorDomain::Config:
      return "Configuration error";
    case pw::ErrorDomain::Dependency:
      return "Dependency error";
    case pw::ErrorDomain::State:
      return "State error";
    case pw::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void ReportError(const pw::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';

    pw::orchestrator::Event event;
    event.category = pw::orchestrator::EventCategory::kDiagnostics;
    event.severity = pw::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = err.what();
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code), pw::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                pw::orchestrator::FieldPrivacy::kPublic, true);
    }
    pw::orchestrator::PublishEvent(event);
  }

  int ExitCodeFor(const pw::Error& err) {
    switch (err.domain) {
    case pw::ErrorDomain::Validation:
    case pw::ErrorDomain::Config:
      return kExitUsage;
    default:
      return kExitFailure;
    }
  }

  bool ConsumeFlag(std::string_view arg, std::string_view name, std::string& out) {
    if (arg.rfind(name, 0) != 0) {
      return false;
    }
    out = std::string(arg.substr(name.size()));
    return true;
  }

  bool SplitAssignment(std::string_view text, std::map<std::string, std::string>& out) {
    const auto eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      return false;
    }
    out[std::string(text.substr(0, eq))] = std::string(text.substr(eq + 1));
    return true;
  }

  // Command output arrives on background threads while task output arrives on
  // the invoking thread; both go through here.
  class Console {
  public:
    void Line(std::string_view source, std::string_view line) {
      std::lock_guard<std::mutex> guard(mutex_);
      if (source.empty()) {
        std::cout << line << '\n';
      } else {
        std::cout << '[' << source << "] " << line << '\n';
      }
    }

    void ErrorLine(std::string_view line) {
      std::lock_guard<std::mutex> guard(mutex_);
      std::cerr << line << '\n';
    }

    pw::orchestrator::OutputSink Sink() {
      return [this](std::string_view source, std::string_view line) { Line(source, line); };
    }

  private:
    std::mutex mutex_;
  };

  // Sends ##vso[...] lines to command plugins and prints everything else as
  // job output.
  class MarkerRouter {
  public:
    MarkerRouter(const pw::orchestrator::PluginManager& manager, pw::orchestrator::JobContext& job,
                 Console& console)
        : manager_(manager), job_(job), console_(console) {}

    void Feed(std::string_view line) {
      auto command = pw::orchestrator::ParseCommandMarker(line);
      if (!command) {
        job_.Output({}, line);
        return;
      }
      try {
        manager_.ProcessCommand(job_, *command);
      } catch (const pw::UnsupportedPluginError& err) {
        ReportError(err);
        ++rejected_;
      }
    }

    // Drains the job's async commands and completes the job.
    int Finish() {
      auto receipt = job_.AsyncCommands().JoinAll();
      for (const auto& result : receipt.Results()) {
        if (!result.succeeded) {
          console_.ErrorLine("Command '" + result.display_name + "' failed: " + result.error_message);
        }
      }
      const bool succeeded = job_.Complete(std::move(receipt));
      return succeeded && rejected_ == 0 ? kExitOk : kExitFailure;
    }

  private:
    const pw::orchestrator::PluginManager& manager_;
    pw::orchestrator::JobContext& job_;
    Console& console_;
    size_t rejected_{0};
  };

  int HandleList(const pw::orchestrator::PluginManager& manager) {
    std::cout << "Task plugins:\n";
    for (const auto& task : manager.Registry().TaskPlugins()) {
      std::cout << "  " << task.id << " (" << task.stage << ") " << task.type_reference << '\n';
    }
    std::cout << "Command plugins:\n";
    for (const auto& command : manager.Registry().CommandPlugins()) {
      std::cout << "  ##vso[" << command.area << '.' << command.event << "] " << command.display_name << " "
                << command.type_reference << '\n';
    }
    return kExitOk;
  }

  int HandleRunTask(const pw::orchestrator::PluginManager& manager, std::string_view task_id,
                    const std::map<std::string, std::string>& inputs,
                    const std::map<std::string, std::string>& environment) {
    auto plugins = manager.GetTaskPlugins(task_id);
    if (!plugins || plugins->empty()) {
      std::cerr << "Validation error: No task plugin registered for " << task_id << '\n';
      return kExitUsage;
    }
    Console console;
    pw::orchestrator::JobContext job({}, console.Sink());
    MarkerRouter router(manager, job, console);
    try {
      manager.RunPluginTask(job, plugins->back(), inputs, environment,
                            [&](const pw::platform::OutputLine& line) {
                              if (line.stream == pw::platform::StreamKind::kStderr) {
                                console.ErrorLine(line.text);
                              } else {
                                router.Feed(line.text);
                              }
                            });
    } catch (const pw::Error&) {
      router.Finish();
      throw;
    }
    return router.Finish();
  }

  int HandleProcessLog(const pw::orchestrator::PluginManager& manager, std::string_view source) {
    std::ifstream file;
    std::istream* in = &std::cin;
    if (source != "-") {
      file.open(std::string(source));
      if (!file) {
        std::cerr << "I/O error: Cannot open " << source << '\n';
        return kExitFailure;
      }
      in = &file;
    }

    Console console;
    pw::orchestrator::JobContext job({}, console.Sink());
    MarkerRouter router(manager, job, console);
    std::string line;
    while (std::getline(*in, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      router.Feed(line);
    }
    return router.Finish();
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    auto layout = pw::orchestrator::HostLayout::FromEnvironment();
    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      std::string value;
      if (ConsumeFlag(arg, "--bin-dir=", value) && !value.empty()) {
        layout.bin_directory = value;
      } else if (ConsumeFlag(arg, "--work-dir=", value) && !value.empty()) {
        layout.work_directory = value;
      } else if (ConsumeFlag(arg, "--helper=", value) && !value.empty()) {
        layout.helper_name = value;
      } else if (ConsumeFlag(arg, "--helper-sha256=", value) && !value.empty()) {
        layout.helper_sha256 = value;
      } else {
        PrintUsage();
        return kExitUsage;
      }
    }
    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }

    const std::string_view cmd = argv[index++];
    if (cmd != "list" && cmd != "run-task" && cmd != "process-log") {
      PrintUsage();
      return kExitUsage;
    }

    auto manager = pw::orchestrator::PluginManager::CreateDefault(std::move(layout));

    if (cmd == "list") {
      if (index != argc) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleList(*manager);
    }
    if (cmd == "run-task") {
      if (index >= argc) {
        PrintUsage();
        return kExitUsage;
      }
      const std::string_view task_id = argv[index++];
      std::map<std::string, std::string> inputs;
      std::map<std::string, std::string> environment;
      for (; index < argc; ++index) {
        std::string_view arg = argv[index];
        std::string value;
        if (ConsumeFlag(arg, "--input=", value) && SplitAssignment(value, inputs)) {
          continue;
        }
        if (ConsumeFlag(arg, "--env=", value) && SplitAssignment(value, environment)) {
          continue;
        }
        PrintUsage();
        return kExitUsage;
      }
      return HandleRunTask(*manager, task_id, inputs, environment);
    }

    if (argc - index != 1) {
      PrintUsage();
      return kExitUsage;
    }
    return HandleProcessLog(*manager, argv[index]);
  } catch (const pw::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "Error: " << err.what() << std::endl;
    return kExitFailure;
  }
}
