#include "sf/orchestrator/event_bus.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <system_error>

namespace sf::orchestrator {
namespace {

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

constexpr size_t kMaxEventBytes = 16 * 1024; // cap on one serialized line

std::string HashTag(std::string_view value) {
  if (value.empty()) {
    return "";
  }
  return "hash:" + HashForTelemetry(value);
}

// Keys that name derived or secret material are hashed even when a caller
// marks them public.
bool FieldKeyImpliesSensitive(std::string_view key) {
  std::string lowered(key);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered.find("secret") != std::string::npos || lowered.find("username") != std::string::npos ||
         lowered.find("salt_bytes") != std::string::npos || lowered.find("raw") != std::string::npos;
}

void AppendEscaped(std::string& out, std::string_view text) {
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        char buffer[7];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<int>(c));
        out += buffer;
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
}

void AppendStringMember(std::string& out, std::string_view key, std::string_view value) {
  out += ",\"";
  AppendEscaped(out, key);
  out += "\":\"";
  AppendEscaped(out, value);
  out += "\"";
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
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

Event BuildOversizeEvent(const Event& original) {
  Event replacement;
  replacement.category = EventCategory::kDiagnostics;
  replacement.severity = EventSeverity::kWarning;
  replacement.event_id = "event_too_large";
  replacement.message = "Event payload exceeded logger limits";
  if (!original.event_id.empty()) {
    replacement.fields.emplace_back("original_event_id", original.event_id, FieldPrivacy::kHash);
  }
  replacement.fields.emplace_back("limit_bytes", std::to_string(kMaxEventBytes), FieldPrivacy::kPublic, true);
  return replacement;
}

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unique_ptr<EventBus>& EventBusSingleton() {
  static std::unique_ptr<EventBus> instance;
  return instance;
}

} // namespace

std::string FormatEventJson(const Event& event, const std::string& timestamp, uint64_t sequence) {
  std::string payload;
  payload.reserve(256);
  payload += "{\"ts\":\"";
  AppendEscaped(payload, timestamp);
  payload += "\",\"seq\":";
  payload += std::to_string(sequence);
  AppendStringMember(payload, "severity", SeverityToString(event.severity));
  AppendStringMember(payload, "category", CategoryToString(event.category));
  if (!event.event_id.empty()) {
    AppendStringMember(payload, "event_id", event.event_id);
  }
  if (!event.message.empty()) {
    AppendStringMember(payload, "message", event.message);
  }
  for (const auto& field : event.fields) {
    std::string sanitized = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]";
    } else if (field.privacy == FieldPrivacy::kHash ||
               FieldKeyImpliesSensitive(field.key)) {
      sanitized = HashTag(field.value);
    }
    const bool sanitized_changed = sanitized != field.value;
    if (field.numeric && field.privacy == FieldPrivacy::kPublic && !sanitized_changed) {
      payload += ",\"";
      AppendEscaped(payload, field.key);
      payload += "\":";
      payload += sanitized;
    } else {
      AppendStringMember(payload, field.key, sanitized);
    }
  }
  payload += "}";
  return payload;
}

JsonLineLogger::JsonLineLogger(std::filesystem::path path, size_t max_bytes)
    : log_path_(std::move(path)), max_bytes_(max_bytes == 0 ? 10 * 1024 * 1024 : max_bytes) {}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log directory create failed\",\"error_code\":"
                << ec.value() << "}" << std::endl;
      return;
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  auto current_size = std::filesystem::file_size(log_path_, ec);
  if (ec) {
    current_size = 0; // not created yet
  }
  if (current_size == 0 || current_size + incoming_bytes <= max_bytes_) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  for (size_t idx = max_files_; idx > 0; --idx) {
    std::filesystem::path src =
        idx == 1 ? log_path_ : std::filesystem::path(log_path_.string() + "." + std::to_string(idx - 1));
    std::filesystem::path dst = std::filesystem::path(log_path_.string() + "." + std::to_string(idx));
    std::error_code rotate_ec;
    if (!std::filesystem::exists(src, rotate_ec) || rotate_ec) {
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    rotate_ec.clear();
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log rotate rename failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
    }
  }
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto timestamp = FormatTimestamp(std::chrono::system_clock::now());
  const uint64_t sequence = entry_counter_.load() + 1;
  std::string line = FormatEventJson(event, timestamp, sequence);
  if (line.size() > kMaxEventBytes) {
    line = FormatEventJson(BuildOversizeEvent(event), timestamp, sequence);
  }

  RotateIfNeeded(line.size() + 1);
  EnsureOpen();
  if (!stream_.is_open()) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}" << std::endl;
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
  entry_counter_.store(sequence);
}

EventBus& EventBus::Instance() {
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  auto& instance = EventBusSingleton();
  if (!instance) {
    instance = std::make_unique<EventBus>();
  }
  return *instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    return; // a subscriber publishing from inside its callback is dropped
  }
  PublishReentrancyGuard guard(in_publish);
  std::shared_ptr<const SubscriberList> targets;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    targets = subscribers_snapshot_;
  }
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto updated = subscribers_snapshot_ ? std::make_shared<SubscriberList>(*subscribers_snapshot_)
                                       : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  subscribers_snapshot_ = std::move(updated);
}

void ResetEventBusForTesting() {
  auto& bus = EventBus::Instance();
  std::lock_guard<std::mutex> guard(bus.subscribers_mutex_);
  bus.subscribers_snapshot_.reset();
}

} // namespace sf::orchestrator
