#include "pw/crypto/sha256.h"
#include "pw/error.h"
#include "pw/orchestrator/plugin_host.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
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
      auto name = std::string{"pw_plugin_host_"} +
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

  struct LineRecorder {
    std::mutex mutex;
    std::vector<pw::platform::OutputLine> lines;

    pw::platform::LineObserver Observer() {
      return [this](const pw::platform::OutputLine& line) {
        std::lock_guard<std::mutex> guard(mutex);
        lines.push_back(line);
      };
    }

    std::vector<std::string> Texts(pw::platform::StreamKind stream) {
      std::lock_guard<std::mutex> guard(mutex);
      std::vector<std::string> out;
      for (const auto& line : lines) {
        if (line.stream == stream) {
          out.push_back(line.text);
        }
      }
      return out;
    }
  };

  pw::orchestrator::HostLayout TestLayout(const std::filesystem::path& work) {
    pw::orchestrator::HostLayout layout;
    layout.bin_directory = PW_TEST_PLUGIN_HOST_DIR;
    layout.work_directory = work;
    layout.helper_name = PW_TEST_PLUGIN_HOST_NAME;
    return layout;
  }

  pw::orchestrator::InvocationRequest Request(pw::orchestrator::InvocationMode mode, std::string reference,
                                              std::string input = "{}") {
    pw::orchestrator::InvocationRequest request;
    request.mode = mode;
    request.type_reference = std::move(reference);
    request.input_document = std::move(input);
    return request;
  }

  constexpr auto kTask = pw::orchestrator::InvocationMode::kTask;
  constexpr auto kCommand = pw::orchestrator::InvocationMode::kCommand;

  void TestClassificationPolicies() {
    using Kind = pw::orchestrator::OutcomeClassification::Kind;
    Expect(pw::orchestrator::ClassifyTaskOutcome(0).kind == Kind::kSucceeded, "task exit 0 succeeds");
    Expect(pw::orchestrator::ClassifyTaskOutcome(7).kind == Kind::kProcessFault, "task exit 7 faults");
    Expect(pw::orchestrator::ClassifyCommandOutcome(0, {}).kind == Kind::kSucceeded,
           "command exit 0 without stderr succeeds");
    auto logical = pw::orchestrator::ClassifyCommandOutcome(0, {"x", "y"});
    Expect(logical.kind == Kind::kLogicalFailure && logical.error_text == "x\ny",
           "command exit 0 with stderr is a logical failure");
    auto fault = pw::orchestrator::ClassifyCommandOutcome(3, {"a", "b"});
    Expect(fault.kind == Kind::kProcessFault && fault.exit_code == 3 && fault.error_text == "a\nb",
           "command non-zero exit is a fault");
  }

  void TestTaskModeSuccessForwardsOutput() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));
    LineRecorder recorder;
    host.Invoke(Request(kTask, "Pw.Test.Done"), recorder.Observer(), {});
    auto out = recorder.Texts(pw::platform::StreamKind::kStdout);
    Expect(out.size() == 1 && out[0] == "##done", "observer must receive ##done");
  }

  void TestTaskModeNonZeroExitIsProcessFault() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));
    bool caught = false;
    try {
      host.Invoke(Request(kTask, "Pw.Test.Exit7"), {}, {});
    } catch (const pw::ProcessFaultError& err) {
      caught = true;
      Expect(err.exit_code == 7, "exit code 7 expected");
      Expect(err.executable == host.HelperPath().string(), "executable path missing from fault");
      Expect(err.arguments == "task \"Pw.Test.Exit7\"", "arguments missing from fault");
      Expect(err.domain == pw::ErrorDomain::Process, "fault must be in process domain");
    }
    Expect(caught, "task exit 7 must raise ProcessFaultError");
  }

  void TestTaskModeForwardsStderr() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));
    LineRecorder recorder;
    host.Invoke(Request(kTask, "Pw.Test.BadInput"), recorder.Observer(), {});
    auto err = recorder.Texts(pw::platform::StreamKind::kStderr);
    Expect(err.size() == 1 && err[0] == "bad input", "task mode forwards stderr lines");
  }

  void TestCommandModeSuccess() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));
    auto outcome = host.Run(Request(kCommand, "Pw.Test.Silent"), {}, {});
    Expect(outcome.Succeeded() && outcome.exit_code == 0, "silent command must succeed");
    host.Invoke(Request(kCommand, "Pw.Test.Silent"), {}, {});
  }

  void TestCommandModeStderrIsLogicalFailure() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));
    LineRecorder recorder;
    bool caught = false;
    try {
      host.Invoke(Request(kCommand, "Pw.Test.BadInput"), recorder.Observer(), {});
    } catch (const pw::LogicalFailureError& err) {
      caught = true;
      Expect(err.error_text == "bad input", "logical failure must carry stderr text");
      Expect(std::string(err.what()) == "bad input", "message must be the stderr text");
    }
    Expect(caught, "exit 0 with stderr must raise LogicalFailureError");
    Expect(recorder.Texts(pw::platform::StreamKind::kStderr).empty(), "command stderr must not be forwarded");
  }

  void TestCommandModeNonZeroExitEmitsJoinedStderr() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));
    LineRecorder recorder;
    bool caught = false;
    try {
      host.Invoke(Request(kCommand, "Pw.Test.Exit3"), recorder.Observer(), {});
    } catch (const pw::ProcessFaultError& err) {
      caught = true;
      Expect(err.exit_code == 3, "exit code 3 expected");
      Expect(err.error_text == "a\nb", "fault must carry joined stderr");
      Expect(err.arguments == "command \"Pw.Test.Exit3\"", "command arguments mismatch");
    }
    Expect(caught, "command exit 3 must raise ProcessFaultError");
    auto emitted = recorder.Texts(pw::platform::StreamKind::kStderr);
    Expect(emitted.size() == 1 && emitted[0] == "a\nb", "joined stderr must be emitted before the fault");
  }

  void TestStdinArgumentsAndWorkingDirectory() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));

    LineRecorder stdin_echo;
    const std::string document = "{\"inputs\":{\"a\":\"b\"}}";
    host.Invoke(Request(kTask, "Pw.Test.EchoStdin", document), stdin_echo.Observer(), {});
    auto echoed = stdin_echo.Texts(pw::platform::StreamKind::kStdout);
    Expect(echoed.size() == 1 && echoed[0] == document, "stdin must carry exactly the input document");

    LineRecorder args;
    host.Invoke(Request(kCommand, "Pw.Test.EchoArgs, Pw.Tests"), args.Observer(), {});
    auto lines = args.Texts(pw::platform::StreamKind::kStdout);
    Expect(lines.size() == 3, "three argument lines expected");
    Expect(lines[0] == "mode=command", "mode token mismatch");
    Expect(lines[1] == "ref=Pw.Test.EchoArgs, Pw.Tests", "type reference must be a single argv token");
    Expect(lines[2] == "cwd=" + std::filesystem::canonical(work.path()).string(), "cwd must be the work dir");
  }

  void TestEnvironmentOnlyInTaskMode() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));

    auto task = Request(kTask, "Pw.Test.EchoEnv:PW_TEST_MARKER");
    task.environment = pw::orchestrator::StringMap{{"PW_TEST_MARKER", "42"}};
    LineRecorder task_lines;
    host.Invoke(task, task_lines.Observer(), {});
    auto seen = task_lines.Texts(pw::platform::StreamKind::kStdout);
    Expect(seen.size() == 1 && seen[0] == "42", "task mode must pass the environment");

    LineRecorder inherited;
    host.Invoke(Request(kTask, "Pw.Test.EchoEnv:PATH"), inherited.Observer(), {});
    auto path = inherited.Texts(pw::platform::StreamKind::kStdout);
    Expect(path.size() == 1 && path[0] != "<unset>", "worker environment must be inherited");

    auto command = Request(kCommand, "Pw.Test.EchoEnv:PW_TEST_MARKER");
    command.environment = pw::orchestrator::StringMap{{"PW_TEST_MARKER", "42"}};
    LineRecorder command_lines;
    host.Invoke(command, command_lines.Observer(), {});
    auto none = command_lines.Texts(pw::platform::StreamKind::kStdout);
    Expect(none.size() == 1 && none[0] == "<unset>", "command mode passes no overrides");
  }

  void TestLargeInterleavedOutputDoesNotDeadlock() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));
    LineRecorder recorder;
    host.Invoke(Request(kTask, "Pw.Test.Flood"), recorder.Observer(), {});
    auto out = recorder.Texts(pw::platform::StreamKind::kStdout);
    auto err = recorder.Texts(pw::platform::StreamKind::kStderr);
    Expect(out.size() == 2000 && err.size() == 2000, "every flooded line must arrive");
    Expect(out.front().rfind("out 0 ", 0) == 0 && out.back().rfind("out 1999 ", 0) == 0,
           "stdout order must be preserved");
  }

  void TestEarlyWriterWithLargeInputDoesNotDeadlock() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));
    LineRecorder recorder;
    const std::string document(6 * 1024 * 1024, 'z');
    host.Invoke(Request(kTask, "Pw.Test.FloodThenReadStdin", document), recorder.Observer(), {});
    auto out = recorder.Texts(pw::platform::StreamKind::kStdout);
    Expect(out.size() == 4097, "output written before stdin must arrive");
    Expect(out.back() == "stdin " + std::to_string(document.size()), "child must read the whole document");
  }

  void TestLineSplittingStripsCarriageReturns() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));
    LineRecorder recorder;
    host.Invoke(Request(kTask, "Pw.Test.CrLf"), recorder.Observer(), {});
    auto out = recorder.Texts(pw::platform::StreamKind::kStdout);
    Expect(out.size() == 3, "three lines expected");
    Expect(out[0] == "first" && out[1] == "second" && out[2] == "tail", "CR must be stripped");
  }

  void TestSignalExitCode() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));
    auto outcome = host.Run(Request(kTask, "Pw.Test.Abort"), {}, {});
    Expect(outcome.exit_code == 128 + 6, "signal exit must be 128 + SIGABRT");
    Expect(!outcome.Succeeded(), "signalled child is a fault");
  }

  void TestMissingHelperAndWorkDirectory() {
    TempDir work;
    auto layout = TestLayout(work.path());
    layout.helper_name = "does_not_exist";
    bool missing = false;
    try {
      pw::orchestrator::PluginHost host(layout);
    } catch (const pw::HelperMissingError& err) {
      missing = err.domain == pw::ErrorDomain::Dependency && err.code == pw::errors::dependency::kHelperMissing;
    }
    Expect(missing, "absent helper must fail construction");

    auto gone = TestLayout(work.path() / "missing");
    pw::orchestrator::PluginHost host(gone);
    bool no_work = false;
    try {
      host.Invoke(Request(kTask, "Pw.Test.Done"), {}, {});
    } catch (const pw::HelperMissingError& err) {
      no_work = err.code == pw::errors::dependency::kWorkDirectoryMissing;
    }
    Expect(no_work, "missing work directory must fail before spawning");
  }

  void TestHelperIntegrityPin() {
    TempDir work;
    auto layout = TestLayout(work.path());
    const auto digest = pw::crypto::SHA256_File(layout.HelperPath());
    layout.helper_sha256 = pw::crypto::HexEncode(digest);
    pw::orchestrator::PluginHost pinned(layout);
    pinned.Invoke(Request(kTask, "Pw.Test.Silent"), {}, {});

    layout.helper_sha256 = std::string(64, '0');
    bool mismatch = false;
    try {
      pw::orchestrator::PluginHost host(layout);
    } catch (const pw::HelperMissingError& err) {
      mismatch = err.domain == pw::ErrorDomain::Security &&
                 err.code == pw::errors::security::kHelperIntegrityMismatch;
    }
    Expect(mismatch, "wrong pin must be rejected");

    layout.helper_sha256 = "not-hex";
    bool invalid = false;
    try {
      pw::orchestrator::PluginHost host(layout);
    } catch (const pw::Error& err) {
      invalid = err.domain == pw::ErrorDomain::Config;
    }
    Expect(invalid, "malformed pin must be a configuration error");
  }

  void TestCancellationLeavesChildRunning() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));
    const auto marker = work.path() / "touched";
    pw::platform::CancellationSource source;

    std::thread canceller([&source]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      source.Cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    bool cancelled = false;
    try {
      host.Invoke(Request(kTask, "Pw.Test.SleepThenTouch:600:" + marker.string()), {}, source.Token());
    } catch (const pw::CancelledError&) {
      cancelled = true;
    }
    canceller.join();
    const auto elapsed = std::chrono::steady_clock::now() - start;
    Expect(cancelled, "cancellation must raise CancelledError");
    Expect(elapsed < std::chrono::milliseconds(550), "cancellation must not wait for the child");
    Expect(!std::filesystem::exists(marker), "child has not finished yet");

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!std::filesystem::exists(marker) && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(25));
    }
    Expect(std::filesystem::exists(marker), "child must keep running after cancellation");
  }

  void TestCancelledFloodKeepsPipesDraining() {
    TempDir work;
    pw::orchestrator::PluginHost host(TestLayout(work.path()));
    const auto marker = work.path() / "flooded";
    pw::platform::CancellationSource source;
    LineRecorder recorder;

    std::thread canceller([&source]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      source.Cancel();
    });
    bool cancelled = false;
    try {
      host.Invoke(Request(kTask, "Pw.Test.FloodThenTouch:300:" + marker.string()), recorder.Observer(),
                  source.Token());
    } catch (const pw::CancelledError&) {
      cancelled = true;
    }
    canceller.join();
    Expect(cancelled, "cancellation must raise CancelledError");

    // 8 MiB cannot fit in a pipe; the marker appears only if output is still read.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!std::filesystem::exists(marker) && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(25));
    }
    Expect(std::filesystem::exists(marker), "abandoned child must not block on a full pipe");
    Expect(recorder.Texts(pw::platform::StreamKind::kStdout).empty(),
           "lines after cancellation must not reach the observer");
  }

  void TestLayoutFromEnvironment() {
    ::setenv("PW_BIN_DIR", "/opt/pw/bin", 1);
    ::setenv("PW_WORK_DIR", "/srv/work", 1);
    ::setenv("PW_PLUGIN_HOST", "custom-host", 1);
    ::setenv("PW_PLUGIN_HOST_SHA256", "ab", 1);
    auto layout = pw::orchestrator::HostLayout::FromEnvironment();
    Expect(layout.bin_directory == "/opt/pw/bin", "PW_BIN_DIR not applied");
    Expect(layout.work_directory == "/srv/work", "PW_WORK_DIR not applied");
    Expect(layout.HelperPath() == std::filesystem::path("/opt/pw/bin/custom-host"), "helper path mismatch");
    Expect(layout.helper_sha256 && *layout.helper_sha256 == "ab", "pin not read");

    ::unsetenv("PW_BIN_DIR");
    ::unsetenv("PW_WORK_DIR");
    ::unsetenv("PW_PLUGIN_HOST");
    ::unsetenv("PW_PLUGIN_HOST_SHA256");
    auto defaults = pw::orchestrator::HostLayout::FromEnvironment();
    Expect(defaults.helper_name == "pw-plugin-host", "default helper name");
    Expect(defaults.work_directory == std::filesystem::current_path() / "_work", "default work directory");
    Expect(!defaults.helper_sha256.has_value(), "no pin by default");

    // A malformed pin is a configuration error.
    TempDir work;
    auto pinned = TestLayout(work.path());
    pinned.helper_sha256 = "ab";
    bool invalid = false;
    try {
      pw::orchestrator::PluginHost host(pinned);
    } catch (const pw::Error& err) {
      invalid = err.domain == pw::ErrorDomain::Config && err.code == pw::errors::config::kInvalidLayout;
    }
    Expect(invalid, "malformed pin must be rejected");
  }

} // namespace

int main() {
  TestClassificationPolicies();
  TestTaskModeSuccessForwardsOutput();
  TestTaskModeNonZeroExitIsProcessFault();
  TestTaskModeForwardsStderr();
  TestCommandModeSuccess();
  TestCommandModeStderrIsLogicalFailure();
  TestCommandModeNonZeroExitEmitsJoinedStderr();
  TestStdinArgumentsAndWorkingDirectory();
  TestEnvironmentOnlyInTaskMode();
  TestLargeInterleavedOutputDoesNotDeadlock();
  TestEarlyWriterWithLargeInputDoesNotDeadlock();
  TestLineSplittingStripsCarriageReturns();
  TestSignalExitCode();
  TestMissingHelperAndWorkDirectory();
  TestHelperIntegrityPin();
  TestCancellationLeavesChildRunning();
  TestCancelledFloodKeepsPipesDraining();
  TestLayoutFromEnvironment();
  std::cout << "test_plugin_host completed" << std::endl;
  return 0;
}
