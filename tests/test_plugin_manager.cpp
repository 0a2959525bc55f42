#include "pw/error.h"
#include "pw/orchestrator/plugin_manager.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace {

  void Expect(bool condition, const char* message) {
    if (!condition) {
      std::cerr << message << std::endl;
      std::abort();
    }
  }

  class TempDir {
  public:
    TempDir() {
      auto base = std::filesystem::temp_directory_path();
      auto name = std::string{"pw_manager_"} +
                  std::to_string(static_cast<unsigned long long>(
                      std::chrono::steady_clock::now().time_since_epoch().count()));
      path_ = base / name;
      std::filesystem::create_directories(path_);
    }

    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

  private:
    std::filesystem::path path_{};
  };

  pw::orchestrator::HostLayout TestLayout(const std::filesystem::path& work) {
    pw::orchestrator::HostLayout layout;
    layout.bin_directory = PW_TEST_PLUGIN_HOST_DIR;
    layout.work_directory = work;
    layout.helper_name = PW_TEST_PLUGIN_HOST_NAME;
    return layout;
  }

  struct Lines {
    std::mutex mutex;
    std::vector<std::string> texts;

    pw::platform::LineObserver Observer() {
      return [this](const pw::platform::OutputLine& line) {
        std::lock_guard<std::mutex> guard(mutex);
        texts.push_back(line.text);
      };
    }
  };

  std::unique_ptr<pw::orchestrator::PluginManager> CustomManager(const std::filesystem::path& work) {
    pw::orchestrator::PluginRegistry registry;
    registry.RegisterTaskPlugin({"aaaaaaaa-0000-0000-0000-000000000001", "main", "Pw.Test.Done"});
    registry.RegisterTaskPlugin({"aaaaaaaa-0000-0000-0000-000000000001", "main", "Pw.Test.EchoStdin"});
    registry.RegisterTaskPlugin({"aaaaaaaa-0000-0000-0000-000000000002", "main", "Pw.Test.Exit7"});
    registry.RegisterTaskPlugin({"aaaaaaaa-0000-0000-0000-000000000003", "main", "Pw.Test.EchoEnv:PW_TEST_TOKEN"});
    registry.RegisterCommandPlugin({"task", "setvariable", "Pw.Test.Sleep:50", "Set variable"});
    registry.Seal();
    return std::make_unique<pw::orchestrator::PluginManager>(std::move(registry),
                                                            pw::orchestrator::PluginHost(TestLayout(work)));
  }

  void TestLookupsGoThroughRegistry() {
    TempDir work;
    auto manager = CustomManager(work.path());
    auto plugins = manager->GetTaskPlugins("AAAAAAAA-0000-0000-0000-000000000001");
    Expect(plugins.has_value() && plugins->size() == 2, "two implementations registered");
    Expect(!manager->GetTaskPlugins("bbbbbbbb-0000-0000-0000-000000000000").has_value(), "unknown id is absent");

    auto command = manager->GetCommandPlugin("Task", "SetVariable");
    Expect(command.has_value() && command->display_name == "Set variable", "command lookup failed");
    Expect(!manager->GetCommandPlugin("task", "other").has_value(), "unknown command is absent");
  }

  void TestRunPluginTaskRejectsUnregisteredReference() {
    TempDir work;
    auto manager = CustomManager(work.path());
    pw::orchestrator::JobContext job;
    Lines lines;

    bool unsupported = false;
    try {
      manager->RunPluginTask(job, "Pw.Test.Silent", {}, {}, lines.Observer());
    } catch (const pw::UnsupportedPluginError& err) {
      unsupported = err.code == pw::errors::validation::kUnsupportedTaskPlugin;
    }
    Expect(unsupported, "unregistered reference must be rejected");

    bool empty = false;
    try {
      manager->RunPluginTask(job, "", {}, {}, lines.Observer());
    } catch (const pw::Error& err) {
      empty = err.domain == pw::ErrorDomain::Validation;
    }
    Expect(empty, "empty reference must be rejected");
    Expect(lines.texts.empty(), "nothing may run for rejected references");
  }

  void TestRunPluginTaskStreamsOutput() {
    TempDir work;
    auto manager = CustomManager(work.path());
    Lines lines;
    pw::orchestrator::JobEnvironment environment;
    environment.variables["system.debug"] = {"true", false, false};
    pw::orchestrator::JobContext job(std::move(environment));

    manager->RunPluginTask(job, "Pw.Test.Done", {}, {}, lines.Observer());
    Expect(lines.texts.size() == 1 && lines.texts[0] == "##done", "task output must reach the observer");

    lines.texts.clear();
    manager->RunPluginTask(job, "Pw.Test.EchoStdin", {{"path", "/src"}}, {}, lines.Observer());
    Expect(lines.texts.size() == 1, "echo must produce one line");
    Expect(lines.texts[0].find("\"inputs\":{\"path\":\"/src\"}") != std::string::npos, "inputs must be serialized");
    Expect(lines.texts[0].find("\"system.debug\"") != std::string::npos, "job variables must be serialized");

    lines.texts.clear();
    manager->RunPluginTask(job, "Pw.Test.EchoEnv:PW_TEST_TOKEN", {}, {{"PW_TEST_TOKEN", "abc"}}, lines.Observer());
    Expect(lines.texts.size() == 1 && lines.texts[0] == "abc", "task environment must reach the plugin");
  }

  void TestRunPluginTaskFaultCarriesExitCode() {
    TempDir work;
    auto manager = CustomManager(work.path());
    pw::orchestrator::JobContext job;
    bool fault = false;
    try {
      manager->RunPluginTask(job, "Pw.Test.Exit7", {}, {}, {});
    } catch (const pw::ProcessFaultError& err) {
      fault = err.exit_code == 7 && err.arguments == "task \"Pw.Test.Exit7\"";
    }
    Expect(fault, "non-zero exit must raise ProcessFaultError");
  }

  void TestProcessCommandRunsInBackground() {
    TempDir work;
    auto manager = CustomManager(work.path());
    std::mutex mutex;
    std::vector<std::pair<std::string, std::string>> output;
    pw::orchestrator::JobContext job({}, [&](std::string_view source, std::string_view line) {
      std::lock_guard<std::mutex> guard(mutex);
      output.emplace_back(std::string(source), std::string(line));
    });

    pw::orchestrator::Command command;
    command.area = "task";
    command.event = "setvariable";
    command.properties["variable"] = "x";
    auto handle = manager->ProcessCommand(job, command);
    Expect(handle && handle->Started(), "handle must be running");

    auto receipt = job.AsyncCommands().JoinAll();
    Expect(receipt.Results().size() == 1 && receipt.AllSucceeded(), "command must succeed");
    Expect(job.Complete(std::move(receipt)), "job must complete");
    Expect(output.size() == 1 && output[0].first == "Set variable" && output[0].second == "slept",
           "command output must be tagged");
  }

  void TestCreateDefaultRegistersBuiltins() {
    TempDir work;
    auto manager = pw::orchestrator::PluginManager::CreateDefault(TestLayout(work.path()));
    auto cache = manager->GetTaskPlugins("d53ccab4-555e-4494-9d06-11db043fb4a9");
    Expect(cache.has_value() && cache->size() == 2, "cache plugins must be registered");
    Expect(manager->Registry().Sealed(), "default registry must be sealed");
    Expect(manager->Host().HelperPath().filename().string() == PW_TEST_PLUGIN_HOST_NAME, "helper path mismatch");

    auto layout = TestLayout(work.path());
    layout.helper_name = "missing_plugin_host";
    bool missing = false;
    try {
      pw::orchestrator::PluginManager::CreateDefault(layout);
    } catch (const pw::HelperMissingError&) {
      missing = true;
    }
    Expect(missing, "missing helper must fail construction");
  }

} // namespace

int main() {
  TestLookupsGoThroughRegistry();
  TestRunPluginTaskRejectsUnregisteredReference();
  TestRunPluginTaskStreamsOutput();
  TestRunPluginTaskFaultCarriesExitCode();
  TestProcessCommandRunsInBackground();
  TestCreateDefaultRegistersBuiltins();
  std::cout << "test_plugin_manager completed" << std::endl;
  return 0;
}
