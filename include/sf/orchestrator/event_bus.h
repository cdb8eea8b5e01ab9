#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "sf/common.h"
#include "sf/crypto/sha256.h"

namespace sf::orchestrator {

  // Structured audit primitives
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

    // First field with `key`, or nullptr.
    const EventField* Find(std::string_view key) const noexcept {
      for (const auto& field : fields) {
        if (field.key == key) {
          return &field;
        }
      }
      return nullptr;
    }
  };

  inline std::string HashForTelemetry(std::string_view input) {
    if (input.empty()) {
      return "";
    }
    auto digest = sf::crypto::SHA256_Hash(AsBytesConst(input));
    return HexEncode(std::span<const uint8_t>(digest.data(), digest.size()));
  }

  // Appends one JSON object per event to `path`, rotating to path.1 .. path.3
  // once the file would exceed `max_bytes`.
  class JsonLineLogger {
  public:
    JsonLineLogger(std::filesystem::path path, size_t max_bytes);
    void Log(const Event& event);

    const std::filesystem::path& path() const noexcept { return log_path_; }
    uint64_t sequence() const noexcept { return entry_counter_.load(); }

  private:
    std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
    std::atomic<uint64_t> entry_counter_{0};
  };

  // Serializes an event the way JsonLineLogger writes it (without the trailing newline).
  std::string FormatEventJson(const Event& event, const std::string& timestamp, uint64_t sequence);

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    // Delivers synchronously to every subscriber on the calling thread.
    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    EventBus() = default;

  private:
    friend void ResetEventBusForTesting();
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  void ResetEventBusForTesting(); // drops every subscriber

} // namespace sf::orchestrator
