#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace pw::platform {

enum class StreamKind { kStdout, kStderr };

struct OutputLine {
  StreamKind stream{StreamKind::kStdout};
  std::string text;
};

using LineObserver = std::function<void(const OutputLine&)>;

// Multi-producer, single-consumer queue of output lines. The channel closes
// once every producer has called CloseProducer and the queue is drained, or
// as soon as the consumer abandons it.
class LineChannel {
 public:
  enum class PopStatus { kLine, kTimeout, kClosed };

  explicit LineChannel(size_t producers) : open_producers_(producers) {}

  LineChannel(const LineChannel&) = delete;
  LineChannel& operator=(const LineChannel&) = delete;

  // Dropped once the channel is abandoned.
  void Push(OutputLine line);
  void CloseProducer();

  // The consumer is gone: queued lines are released and later pushes are
  // discarded, so producers can keep draining their source.
  void Abandon();
  size_t Pending() const;

  PopStatus WaitPop(OutputLine& out, std::chrono::milliseconds timeout);

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<OutputLine> lines_;
  size_t open_producers_;
  bool abandoned_{false};
};

// Accumulates raw bytes and emits complete lines; a trailing '\r' is stripped.
class LineSplitter {
 public:
  template <typename Emit>
  void Feed(const char* data, size_t size, Emit&& emit) {
    pending_.append(data, size);
    size_t start = 0;
    for (size_t newline = pending_.find('\n', start); newline != std::string::npos;
         newline = pending_.find('\n', start)) {
      emit(Strip(pending_.substr(start, newline - start)));
      start = newline + 1;
    }
    pending_.erase(0, start);
  }

  template <typename Emit>
  void Finish(Emit&& emit) {
    if (!pending_.empty()) {
      emit(Strip(std::move(pending_)));
      pending_.clear();
    }
  }

 private:
  static std::string Strip(std::string line) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    return line;
  }

  std::string pending_;
};

} // namespace pw::platform
