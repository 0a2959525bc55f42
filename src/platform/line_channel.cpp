#include "pw/platform/line_channel.h"

#include <utility>

namespace pw::platform {

void LineChannel::Push(OutputLine line) {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (abandoned_) {
      return;
    }
    lines_.push_back(std::move(line));
  }
  cv_.notify_one();
}

void LineChannel::CloseProducer() {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (open_producers_ > 0) {
      --open_producers_;
    }
  }
  cv_.notify_all();
}

void LineChannel::Abandon() {
  std::deque<OutputLine> released;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    abandoned_ = true;
    released.swap(lines_);
  }
  cv_.notify_all();
}

size_t LineChannel::Pending() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return lines_.size();
}

LineChannel::PopStatus LineChannel::WaitPop(OutputLine& out, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  const bool ready = cv_.wait_for(lock, timeout, [this]() {
    return abandoned_ || !lines_.empty() || open_producers_ == 0;
  });
  if (!ready) {
    return PopStatus::kTimeout;
  }
  if (abandoned_) {
    return PopStatus::kClosed;
  }
  if (!lines_.empty()) {
    out = std::move(lines_.front());
    lines_.pop_front();
    return PopStatus::kLine;
  }
  return PopStatus::kClosed;
}

} // namespace pw::platform
