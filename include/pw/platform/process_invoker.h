#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pw/platform/cancellation.h"
#include "pw/platform/line_channel.h"

namespace pw::platform {

struct ProcessStartInfo {
  std::filesystem::path file;
  std::vector<std::string> arguments;
  std::filesystem::path working_directory;
  // Layered over the current process environment when set.
  std::optional<std::map<std::string, std::string>> environment;
  // Written to the child's stdin, which is then closed.
  std::string standard_input;
};

// Spawns a child and streams its output. stdout and stderr each get a reader
// thread, stdin gets a writer thread, and a waiter thread reaps the child.
// Lines reach the observer on the calling thread as they arrive.
class ProcessInvoker {
 public:
  explicit ProcessInvoker(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50))
      : poll_interval_(poll_interval) {}

  // Returns the child's exit code (128 + signal when killed by a signal).
  // Throws CancelledError when the token fires; the child is not killed and is
  // reaped in the background. Spawn failures throw Error{IO}.
  int Execute(const ProcessStartInfo& info, const LineObserver& observer,
              const CancellationToken& token) const;

 private:
  std::chrono::milliseconds poll_interval_;
};

} // namespace pw::platform
