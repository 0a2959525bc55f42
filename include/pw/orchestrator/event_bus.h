#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pw::orchestrator {

  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  std::string_view ToString(EventSeverity severity) noexcept;
  // Accepts debug, info, warning, error and critical (any case).
  bool ParseSeverity(std::string_view text, EventSeverity& out) noexcept;

  // SHA-256 hex of `input`; empty input hashes to an empty string.
  std::string HashForTelemetry(std::string_view input);

  // One JSON object, no trailing newline. Keys that look like credentials are
  // redacted even when the field is marked public.
  std::string BuildEventJson(const Event& event, const std::string& timestamp);

  struct LoggerOptions {
    size_t max_bytes{10 * 1024 * 1024};
    size_t max_files{3};
    EventSeverity min_severity{EventSeverity::kDebug};

    // PW_LOG_MAX_SIZE (bytes) and PW_LOG_LEVEL; malformed values keep the
    // defaults.
    static LoggerOptions FromEnvironment();
  };

  // Appends events to a JSON-lines file and rotates it to .1 .. .N.
  class JsonLineLogger {
  public:
    JsonLineLogger();
    explicit JsonLineLogger(std::filesystem::path log_path,
                            LoggerOptions options = LoggerOptions::FromEnvironment());

    void Log(const Event& event);

    const std::filesystem::path& Path() const noexcept { return log_path_; }

  private:
    bool Open();
    void Rotate(size_t incoming_bytes);
    std::filesystem::path RotatedPath(size_t generation) const;

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    LoggerOptions options_;
    bool disabled_{false};
  };

  // <PW_LOG_DIR or cwd/logs>/worker.log
  std::filesystem::path DefaultLogPath();
  JsonLineLogger& DefaultJsonLogger();

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    // The default bus forwards to DefaultJsonLogger. Callers share ownership,
    // so a bus replaced by ResetEventBusForTesting outlives its last user.
    static std::shared_ptr<EventBus> Instance();

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> Snapshot() const;

    mutable std::mutex mutex_;
    std::shared_ptr<const SubscriberList> subscribers_{std::make_shared<SubscriberList>()};
  };

  // Publishes on the default bus; failures are reported on std::clog and never
  // propagate to the caller.
  void PublishEvent(const Event& event) noexcept;

  // Replaces the default bus with a fresh one carrying only the logger. A
  // Publish already running finishes on the bus it started with.
  void ResetEventBusForTesting();

} // namespace pw::orchestrator
