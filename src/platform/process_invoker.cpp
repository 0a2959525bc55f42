#include "pw/platform/process_invoker.h"

#include <array>
#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <memory>
#include <mutex>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "pw/common.h"
#include "pw/error.h"
#include "pw/errors.h"

extern char** environ;

namespace pw::platform {
namespace {

class FileDescriptor {
 public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) : fd_(fd) {}

  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

  FileDescriptor& operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  ~FileDescriptor() { reset(); }

  int get() const { return fd_; }
  explicit operator bool() const { return fd_ >= 0; }

  void reset(int new_fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = new_fd;
  }

 private:
  int fd_{-1};
};

struct Pipe {
  FileDescriptor read_end;
  FileDescriptor write_end;

  static Pipe Create() {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      const int err = errno;
      throw Error{ErrorDomain::IO, err, "pipe2 failed", err};
    }
    Pipe pipe;
    pipe.read_end.reset(fds[0]);
    pipe.write_end.reset(fds[1]);
    return pipe;
  }
};

struct ExitState {
  std::mutex mutex;
  std::condition_variable cv;
  std::optional<int> exit_code;
};

// Threads still running when the invocation is abandoned keep their shared
// state alive and finish on their own.
class ThreadGroup {
 public:
  ThreadGroup() = default;
  ThreadGroup(const ThreadGroup&) = delete;
  ThreadGroup& operator=(const ThreadGroup&) = delete;

  ~ThreadGroup() { DetachAll(); }

  void Add(std::thread thread) { threads_.push_back(std::move(thread)); }

  void JoinAll() {
    for (auto& thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }

  void DetachAll() noexcept {
    for (auto& thread : threads_) {
      if (thread.joinable()) {
        thread.detach();
      }
    }
  }

 private:
  std::vector<std::thread> threads_;
};

void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, []() {
    struct sigaction action {};
    action.sa_handler = SIG_IGN;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGPIPE, &action, nullptr);
  });
}

void WriteAll(FileDescriptor fd, std::string payload) {
  size_t written = 0;
  while (written < payload.size()) {
    ssize_t rc = ::write(fd.get(), payload.data() + written, payload.size() - written);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      return;  // child closed stdin early
    }
    written += static_cast<size_t>(rc);
  }
}

void ReadLines(FileDescriptor fd, StreamKind stream, std::shared_ptr<LineChannel> channel) {
  LineSplitter splitter;
  auto emit = [&](std::string text) { channel->Push(OutputLine{stream, std::move(text)}); };
  std::array<char, 4096> buffer{};
  while (true) {
    ssize_t rc = ::read(fd.get(), buffer.data(), buffer.size());
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (rc == 0)
      break;
    splitter.Feed(buffer.data(), static_cast<size_t>(rc), emit);
  }
  splitter.Finish(emit);
  channel->CloseProducer();
}

void WaitForExit(pid_t pid, std::shared_ptr<ExitState> state) {
  int status = 0;
  pid_t rc = -1;
  do {
    rc = ::waitpid(pid, &status, 0);
  } while (rc < 0 && errno == EINTR);

  int exit_code = -1;
  if (rc == pid) {
    if (WIFEXITED(status)) {
      exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      exit_code = 128 + WTERMSIG(status);
    }
  }
  {
    std::lock_guard<std::mutex> guard(state->mutex);
    state->exit_code = exit_code;
  }
  state->cv.notify_all();
}

std::vector<std::string> BuildEnvironment(const std::optional<std::map<std::string, std::string>>& overrides) {
  std::map<std::string, std::string> merged;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string_view kv(*entry);
    const auto eq = kv.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      continue;
    }
    merged[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
  }
  if (overrides) {
    for (const auto& [name, value] : *overrides) {
      merged[name] = value;
    }
  }
  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& [name, value] : merged) {
    out.push_back(name + "=" + value);
  }
  return out;
}

std::vector<char*> ToPointerArray(std::vector<std::string>& values) {
  std::vector<char*> out;
  out.reserve(values.size() + 1);
  for (auto& value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

[[noreturn]] void ReportExecFailure(int fd, int err) {
  ssize_t ignored = ::write(fd, &err, sizeof(err));
  (void)ignored;
  ::_exit(127);
}

// Readers keep draining the child's pipes after this; their lines are dropped.
[[noreturn]] void ThrowCancelled(ThreadGroup& threads, LineChannel& channel) {
  channel.Abandon();
  threads.DetachAll();
  throw CancelledError(std::string(errors::msg::kInvocationCancelled));
}

} // namespace

int ProcessInvoker::Execute(const ProcessStartInfo& info, const LineObserver& observer,
                            const CancellationToken& token) const {
  IgnoreSigpipeOnce();

  const std::string file = PathToUtf8String(info.file);
  const std::string cwd = PathToUtf8String(info.working_directory);
  std::vector<std::string> argv_storage;
  argv_storage.reserve(info.arguments.size() + 1);
  argv_storage.push_back(file);
  argv_storage.insert(argv_storage.end(), info.arguments.begin(), info.arguments.end());
  auto argv = ToPointerArray(argv_storage);
  auto env_storage = BuildEnvironment(info.environment);
  auto envp = ToPointerArray(env_storage);

  Pipe stdin_pipe = Pipe::Create();
  Pipe stdout_pipe = Pipe::Create();
  Pipe stderr_pipe = Pipe::Create();
  Pipe exec_error = Pipe::Create();

  pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    throw Error{ErrorDomain::IO, err, "fork failed for '" + file + "'", err};
  }
  if (pid == 0) {
    struct sigaction action {};
    action.sa_handler = SIG_DFL;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGPIPE, &action, nullptr);
    if (::dup2(stdin_pipe.read_end.get(), STDIN_FILENO) < 0 ||
        ::dup2(stdout_pipe.write_end.get(), STDOUT_FILENO) < 0 ||
        ::dup2(stderr_pipe.write_end.get(), STDERR_FILENO) < 0) {
      ReportExecFailure(exec_error.write_end.get(), errno);
    }
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      ReportExecFailure(exec_error.write_end.get(), errno);
    }
    ::execve(file.c_str(), argv.data(), envp.data());
    ReportExecFailure(exec_error.write_end.get(), errno);
  }

  stdin_pipe.read_end.reset();
  stdout_pipe.write_end.reset();
  stderr_pipe.write_end.reset();
  exec_error.write_end.reset();

  int child_errno = 0;
  ssize_t got = -1;
  do {
    got = ::read(exec_error.read_end.get(), &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
    }
    throw Error{ErrorDomain::IO, child_errno,
                "Failed to start '" + file + "': " + std::system_category().message(child_errno),
                child_errno};
  }

  auto exit_state = std::make_shared<ExitState>();
  auto channel = std::make_shared<LineChannel>(2);
  ThreadGroup threads;
  threads.Add(std::thread(WaitForExit, pid, exit_state));
  threads.Add(std::thread(WriteAll, std::move(stdin_pipe.write_end), info.standard_input));
  threads.Add(std::thread(ReadLines, std::move(stdout_pipe.read_end), StreamKind::kStdout, channel));
  threads.Add(std::thread(ReadLines, std::move(stderr_pipe.read_end), StreamKind::kStderr, channel));

  OutputLine line;
  while (true) {
    if (token.IsCancellationRequested()) {
      ThrowCancelled(threads, *channel);
    }
    const auto status = channel->WaitPop(line, poll_interval_);
    if (status == LineChannel::PopStatus::kClosed) {
      break;
    }
    if (status == LineChannel::PopStatus::kLine && observer) {
      observer(line);
    }
  }

  int exit_code = -1;
  {
    std::unique_lock<std::mutex> lock(exit_state->mutex);
    while (!exit_state->exit_code) {
      if (token.IsCancellationRequested()) {
        lock.unlock();
        ThrowCancelled(threads, *channel);
      }
      exit_state->cv.wait_for(lock, poll_interval_);
    }
    exit_code = *exit_state->exit_code;
  }
  threads.JoinAll();
  return exit_code;
}

} // namespace pw::platform
