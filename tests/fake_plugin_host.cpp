// Stand-in for the plugin host executable. argv: <task|command> <type-reference>
// The type name (before any ", module") selects the behavior, unless
// PW_TEST_PLUGIN_BEHAVIOR names one:
//   Pw.Test.Done                  prints "##done"
//   Pw.Test.Exit7                 exits 7
//   Pw.Test.Silent                exits 0 without output
//   Pw.Test.BadInput              "bad input" on stderr, exits 0
//   Pw.Test.Exit3                 "a" and "b" on stderr, exits 3
//   Pw.Test.EchoStdin             copies stdin to stdout
//   Pw.Test.EchoArgs              prints mode, reference and working directory
//   Pw.Test.EchoEnv:<name>        prints the variable's value or "<unset>"
//   Pw.Test.Sleep:<ms>            sleeps, then prints "slept"
//   Pw.Test.SleepThenTouch:<ms>:<path>  sleeps, then creates <path>
//   Pw.Test.Flood                 interleaves large stdout and stderr output
//   Pw.Test.FloodThenReadStdin    writes 1 MiB before reading stdin, then
//                                 prints "stdin <bytes>"
//   Pw.Test.FloodThenTouch:<ms>:<path>  sleeps, writes 8 MiB, then creates <path>
//   Pw.Test.Marker                "before", an artifact.upload marker, "after"
//   Pw.Test.CrLf                  CRLF line endings and an unterminated tail
//   Pw.Test.Abort                 terminates with SIGABRT

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <thread>

namespace {

std::string ReadAllStdin() {
  return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

void SleepMillis(std::string_view text) {
  const auto ms = std::strtol(std::string(text).c_str(), nullptr, 10);
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

void WriteBlock(size_t lines) {
  const std::string payload(255, 'y');
  for (size_t i = 0; i < lines; ++i) {
    std::cout << payload << '\n';
  }
  std::cout.flush();
}

} // namespace

int main(int argc, char** argv) {
  if (argc != 3) {
    std::cerr << "usage: fake_plugin_host <task|command> <type-reference>" << std::endl;
    return 64;
  }
  const std::string_view mode = argv[1];
  if (mode != "task" && mode != "command") {
    std::cerr << "unknown mode " << mode << std::endl;
    return 64;
  }
  const std::string_view reference = argv[2];
  std::string type_name(reference.substr(0, reference.find(',')));
  if (const char* behavior = std::getenv("PW_TEST_PLUGIN_BEHAVIOR"); behavior && *behavior != '\0') {
    type_name = behavior;
  }
  const auto colon = type_name.find(':');
  const std::string name = type_name.substr(0, colon);
  const std::string parameter = colon == std::string::npos ? std::string() : type_name.substr(colon + 1);

  // These write before touching stdin.
  if (name == "Pw.Test.FloodThenReadStdin") {
    WriteBlock(4096);
    std::cout << "stdin " << ReadAllStdin().size() << std::endl;
    return 0;
  }
  if (name == "Pw.Test.FloodThenTouch") {
    const auto split = parameter.find(':');
    SleepMillis(std::string_view(parameter).substr(0, split));
    WriteBlock(32768);
    std::ofstream touch(parameter.substr(split + 1));
    touch << "done\n";
    return 0;
  }

  const std::string input = ReadAllStdin();

  if (name == "Pw.Test.Done") {
    std::cout << "##done" << std::endl;
    return 0;
  }
  if (name == "Pw.Test.Exit7") {
    return 7;
  }
  if (name == "Pw.Test.Silent") {
    return 0;
  }
  if (name == "Pw.Test.BadInput") {
    std::cerr << "bad input" << std::endl;
    return 0;
  }
  if (name == "Pw.Test.Exit3") {
    std::cerr << "a" << std::endl;
    std::cerr << "b" << std::endl;
    return 3;
  }
  if (name == "Pw.Test.EchoStdin") {
    std::cout << input << std::endl;
    return 0;
  }
  if (name == "Pw.Test.EchoArgs") {
    std::cout << "mode=" << mode << '\n';
    std::cout << "ref=" << reference << '\n';
    std::cout << "cwd=" << std::filesystem::current_path().string() << std::endl;
    return 0;
  }
  if (name == "Pw.Test.EchoEnv") {
    const char* value = std::getenv(parameter.c_str());
    std::cout << (value ? value : "<unset>") << std::endl;
    return 0;
  }
  if (name == "Pw.Test.Sleep") {
    SleepMillis(parameter);
    std::cout << "slept" << std::endl;
    return 0;
  }
  if (name == "Pw.Test.SleepThenTouch") {
    const auto split = parameter.find(':');
    SleepMillis(std::string_view(parameter).substr(0, split));
    std::ofstream touch(parameter.substr(split + 1));
    touch << "done\n";
    return 0;
  }
  if (name == "Pw.Test.Flood") {
    const std::string payload(256, 'x');
    for (int i = 0; i < 2000; ++i) {
      std::cout << "out " << i << ' ' << payload << '\n';
      std::cerr << "err " << i << ' ' << payload << '\n';
    }
    std::cout.flush();
    std::cerr.flush();
    return 0;
  }
  if (name == "Pw.Test.Marker") {
    std::cout << "before\n";
    std::cout << "##vso[artifact.upload artifactname=drop]/tmp/out\n";
    std::cout << "after" << std::endl;
    return 0;
  }
  if (name == "Pw.Test.CrLf") {
    std::cout << "first\r\nsecond\r\ntail" << std::flush;
    return 0;
  }

  if (name == "Pw.Test.Abort") {
    std::abort();
  }

  std::cerr << "unknown plugin " << reference << std::endl;
  return 2;
}
