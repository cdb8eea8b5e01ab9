#include "sf/orchestrator/config.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <string_view>

#include "sf/error.h"
#include "sf/orchestrator/event_bus.h"

namespace sf::orchestrator {

namespace {

const char* ReadEnv(const char* name) {
  const char* env = std::getenv(name);
  if (!env || *env == '\0') {
    return nullptr;
  }
  return env;
}

[[noreturn]] void ThrowMalformed(const char* name, std::string_view value, const char* expected) {
  throw Error{ErrorDomain::Config, errors::config::kMalformedValue,
              std::string("Malformed value for ") + name + ": expected " + expected,
              std::nullopt, Retryability::kFatal,
              {ContextEntry("variable", name), ContextEntry("value", value)}};
}

template <class T>
void ParseUnsigned(const char* name, T& target, T minimum, T maximum) {
  const char* env = ReadEnv(name);
  if (!env) {
    return;
  }
  const size_t len = std::strlen(env);
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(env, env + len, value);
  if (ec != std::errc() || ptr != env + len || value < minimum || value > maximum) {
    ThrowMalformed(name, env, "an unsigned integer in range");
  }
  target = static_cast<T>(value);
}

void ParseBool(const char* name, bool& target) {
  const char* env = ReadEnv(name);
  if (!env) {
    return;
  }
  std::string lowered(env);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "1" || lowered == "true" || lowered == "on" || lowered == "yes") {
    target = true;
  } else if (lowered == "0" || lowered == "false" || lowered == "off" || lowered == "no") {
    target = false;
  } else {
    ThrowMalformed(name, env, "a boolean");
  }
}

} // namespace

RuntimeConfig LoadRuntimeConfig() {
  RuntimeConfig config;
  ParseUnsigned<uint32_t>("SF_POOL_TTL_DAYS", config.pool_ttl_days, 1, 3650);
  ParseUnsigned<uint32_t>("SF_MIN_SALT_BITS", config.min_salt_bits, 128, 1u << 20);
  ParseUnsigned<uint32_t>("SF_USERNAME_LENGTH", config.username_length, 1, 128);
  ParseUnsigned<uint32_t>("SF_DICE_PER_ROLL", config.dice_per_roll, 1, 100);
  ParseUnsigned<size_t>("SF_AUDIT_LOG_MAX_SIZE", config.audit_log_max_bytes, 1,
                        std::numeric_limits<size_t>::max());
  ParseBool("SF_USE_MLOCKALL", config.use_mlockall);

  if (const char* env = ReadEnv("SF_MIN_QUALITY")) {
    auto tier = core::ParseQualityTier(env);
    if (!tier) {
      ThrowMalformed("SF_MIN_QUALITY", env, "EXCELLENT, GOOD, FAIR or POOR");
    }
    config.min_quality = *tier;
  }
  if (const char* env = ReadEnv("SF_NOISE_DEVICE")) {
    config.noise_device = env;
  }
  if (const char* env = ReadEnv("SF_AUDIT_LOG")) {
    config.audit_log = env;
  }
  return config;
}

std::shared_ptr<JsonLineLogger> InstallAuditSink(const RuntimeConfig& config) {
  if (config.audit_log.empty()) {
    return nullptr;
  }
  auto logger = std::make_shared<JsonLineLogger>(config.audit_log, config.audit_log_max_bytes);
  EventBus::Instance().Subscribe([logger](const Event& event) { logger->Log(event); });
  return logger;
}

std::optional<platform::MemoryLockStatus> ApplyMemoryPolicy(const RuntimeConfig& config) {
  if (!config.use_mlockall) {
    return std::nullopt;
  }
  const auto status = platform::LockProcessMemory();
  if (status != platform::MemoryLockStatus::kLocked) {
    const int err = platform::LastLockError();
    std::clog << "saltforge warning: mlockall() failed (errno " << err << "); sensitive pages may swap.\n";
    Event event;
    event.category = EventCategory::kSecurity;
    event.severity = EventSeverity::kWarning;
    event.event_id = "memory_lock_failure";
    event.message = "Process-wide memory locking failed";
    event.fields.emplace_back("errno", std::to_string(err), FieldPrivacy::kPublic, true);
    event.fields.emplace_back("status", status == platform::MemoryLockStatus::kUnsupported ? "unsupported"
                                                                                         : "best_effort");
    EventBus::Instance().Publish(event);
  }
  return status;
}

} // namespace sf::orchestrator
