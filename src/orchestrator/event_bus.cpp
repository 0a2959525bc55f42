#include "pw/orchestrator/event_bus.h"

#include "pw/codec/json_writer.h"
#include "pw/common.h"
#include "pw/crypto/sha256.h"

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <system_error>
#include <utility>

namespace pw::orchestrator {
namespace {

constexpr std::string_view kRedacted = "[REDACTED]";

struct SeverityName {
  EventSeverity severity;
  std::string_view name;
};

constexpr SeverityName kSeverityNames[] = {
    {EventSeverity::kDebug, "debug"},
    {EventSeverity::kInfo, "info"},
    {EventSeverity::kWarning, "warning"},
    {EventSeverity::kError, "error"},
    {EventSeverity::kCritical, "critical"},
};

std::string_view CategoryName(EventCategory category) noexcept {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

// Endpoint parameters and variables routinely carry these.
bool LooksLikeCredential(std::string_view key) {
  static constexpr std::string_view kMarkers[] = {"token", "password", "secret", "authorization",
                                                  "accesskey", "apikey"};
  const auto lowered = ToLowerAscii(key);
  for (auto marker : kMarkers) {
    if (lowered.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

void WriteFieldValue(codec::JsonWriter& json, const EventField& field) {
  FieldPrivacy privacy = field.privacy;
  if (privacy == FieldPrivacy::kPublic && LooksLikeCredential(field.key)) {
    privacy = FieldPrivacy::kRedact;
  }
  switch (privacy) {
  case FieldPrivacy::kRedact:
    json.String(kRedacted);
    return;
  case FieldPrivacy::kHash:
    json.String("hash:" + HashForTelemetry(field.value));
    return;
  case FieldPrivacy::kPublic:
    break;
  }
  if (field.numeric) {
    int64_t number = 0;
    const char* end = field.value.data() + field.value.size();
    auto [ptr, ec] = std::from_chars(field.value.data(), end, number);
    if (ec == std::errc() && ptr == end) {
      json.Int(number);
      return;
    }
  }
  json.String(field.value);
}

std::string UtcTimestamp(std::chrono::system_clock::time_point now) {
  const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now - seconds).count();
  const std::time_t tt = std::chrono::system_clock::to_time_t(seconds);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(micros));
  return buffer;
}

void ReportLoggerError(std::string_view message, int code) {
  std::clog << "{\"event\":\"logger_error\",\"message\":\"" << codec::EscapeJson(message)
            << "\",\"error_code\":" << code << "}" << std::endl;
}

std::mutex& DefaultBusMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<EventBus> MakeDefaultBus() {
  auto bus = std::make_shared<EventBus>();
  bus->Subscribe([](const Event& event) { DefaultJsonLogger().Log(event); });
  return bus;
}

std::shared_ptr<EventBus>& DefaultBusSlot() {
  static std::shared_ptr<EventBus> bus;
  return bus;
}

} // namespace

std::string_view ToString(EventSeverity severity) noexcept {
  for (const auto& entry : kSeverityNames) {
    if (entry.severity == severity) {
      return entry.name;
    }
  }
  return "info";
}

bool ParseSeverity(std::string_view text, EventSeverity& out) noexcept {
  for (const auto& entry : kSeverityNames) {
    if (EqualsIgnoreCase(text, entry.name)) {
      out = entry.severity;
      return true;
    }
  }
  return false;
}

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return {};
  }
  const auto digest = crypto::SHA256_Hash(input);
  return crypto::HexEncode(digest);
}

std::string BuildEventJson(const Event& event, const std::string& timestamp) {
  codec::JsonWriter json;
  json.BeginObject();
  json.Key("ts").String(timestamp);
  json.Key("severity").String(ToString(event.severity));
  json.Key("category").String(CategoryName(event.category));
  if (!event.event_id.empty()) {
    json.Key("event_id").String(event.event_id);
  }
  if (!event.message.empty()) {
    json.Key("message").String(event.message);
  }
  for (const auto& field : event.fields) {
    json.Key(field.key);
    WriteFieldValue(json, field);
  }
  json.EndObject();
  return json.Take();
}

LoggerOptions LoggerOptions::FromEnvironment() {
  LoggerOptions options;
  if (const char* size = std::getenv("PW_LOG_MAX_SIZE"); size && *size != '\0') {
    const std::string_view text(size);
    unsigned long long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc() && ptr == text.data() + text.size() && value > 0) {
      options.max_bytes = static_cast<size_t>(value);
    }
  }
  if (const char* level = std::getenv("PW_LOG_LEVEL"); level && *level != '\0') {
    if (!ParseSeverity(level, options.min_severity)) {
      ReportLoggerError("unknown PW_LOG_LEVEL ignored", 0);
    }
  }
  return options;
}

std::filesystem::path DefaultLogPath() {
  std::filesystem::path directory;
  if (const char* env = std::getenv("PW_LOG_DIR"); env && *env != '\0') {
    directory = env;
  } else {
    std::error_code ec;
    directory = std::filesystem::current_path(ec) / "logs";
  }
  return directory / "worker.log";
}

JsonLineLogger::JsonLineLogger() : JsonLineLogger(DefaultLogPath()) {}

JsonLineLogger::JsonLineLogger(std::filesystem::path log_path, LoggerOptions options)
    : log_path_(std::move(log_path)), options_(options) {}

std::filesystem::path JsonLineLogger::RotatedPath(size_t generation) const {
  if (generation == 0) {
    return log_path_;
  }
  auto rotated = log_path_;
  rotated += "." + std::to_string(generation);
  return rotated;
}

bool JsonLineLogger::Open() {
  if (stream_.is_open()) {
    return true;
  }
  const auto directory = log_path_.parent_path();
  if (!directory.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
      ReportLoggerError("log directory create failed", ec.value());
      disabled_ = true;
      return false;
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
  if (!stream_.is_open()) {
    ReportLoggerError("failed to open log file", 0);
    return false;
  }
  return true;
}

void JsonLineLogger::Rotate(size_t incoming_bytes) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(log_path_, ec);
  if (ec || size + incoming_bytes <= options_.max_bytes) {
    return;
  }
  stream_.close();
  // Oldest generation is overwritten.
  for (size_t generation = options_.max_files; generation > 0; --generation) {
    const auto from = RotatedPath(generation - 1);
    if (!std::filesystem::exists(from, ec)) {
      continue;
    }
    std::filesystem::rename(from, RotatedPath(generation), ec);
    if (ec) {
      ReportLoggerError("log rotate rename failed", ec.value());
    }
  }
}

void JsonLineLogger::Log(const Event& event) {
  if (event.severity < options_.min_severity) {
    return;
  }
  const auto line = BuildEventJson(event, UtcTimestamp(std::chrono::system_clock::now()));
  std::lock_guard<std::mutex> guard(mutex_);
  if (disabled_) {
    return;
  }
  Rotate(line.size() + 1);
  if (!Open()) {
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
}

JsonLineLogger& DefaultJsonLogger() {
  static JsonLineLogger logger;
  return logger;
}

std::shared_ptr<EventBus> EventBus::Instance() {
  std::lock_guard<std::mutex> guard(DefaultBusMutex());
  auto& slot = DefaultBusSlot();
  if (!slot) {
    slot = MakeDefaultBus();
  }
  return slot;
}

std::shared_ptr<const EventBus::SubscriberList> EventBus::Snapshot() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return subscribers_;
}

void EventBus::Publish(const Event& event) {
  // A subscriber that publishes would recurse through the logger.
  static thread_local bool publishing = false;
  if (publishing) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"event_id\":\"" << codec::EscapeJson(event.event_id)
              << "\"}" << std::endl;
    return;
  }
  publishing = true;
  struct Reset {
    ~Reset() { publishing = false; }
  } reset;

  const auto subscribers = Snapshot();
  for (const auto& subscriber : *subscribers) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto next = std::make_shared<SubscriberList>(*subscribers_);
  next->push_back(std::move(fn));
  subscribers_ = std::move(next);
}

void PublishEvent(const Event& event) noexcept {
  try {
    EventBus::Instance()->Publish(event);
  } catch (const std::exception& ex) {
    std::clog << "{\"event\":\"event_publish_failed\",\"event_id\":\"" << codec::EscapeJson(event.event_id)
              << "\",\"error\":\"" << codec::EscapeJson(ex.what()) << "\"}" << std::endl;
  }
}

void ResetEventBusForTesting() {
  auto fresh = MakeDefaultBus();
  std::shared_ptr<EventBus> previous;
  {
    std::lock_guard<std::mutex> guard(DefaultBusMutex());
    previous = std::exchange(DefaultBusSlot(), std::move(fresh));
  }
}

} // namespace pw::orchestrator
