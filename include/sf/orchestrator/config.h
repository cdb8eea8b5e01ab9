#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "sf/core/validator.h"
#include "sf/platform/memory_lock.h"

namespace sf::orchestrator {

class JsonLineLogger;

// Process settings read from SF_* environment variables.
struct RuntimeConfig {
  uint32_t pool_ttl_days{90};
  uint32_t min_salt_bits{256};
  core::QualityTier min_quality{core::QualityTier::kGood};
  uint32_t username_length{16};
  std::filesystem::path noise_device{"/dev/hwrng"};
  uint32_t dice_per_roll{5};
  std::filesystem::path audit_log;          // empty disables the file sink
  size_t audit_log_max_bytes{10 * 1024 * 1024};
  bool use_mlockall{false};
};

// Unset variables keep their defaults; malformed values throw Error{Config}.
RuntimeConfig LoadRuntimeConfig();

// Subscribes a JsonLineLogger on the process EventBus when config.audit_log is
// set. Returns the logger (null when disabled); the bus keeps it alive.
std::shared_ptr<JsonLineLogger> InstallAuditSink(const RuntimeConfig& config);

// Locks the whole process against paging when config.use_mlockall is set.
// Returns nullopt when not requested; a failed lock is logged to std::clog and
// published as memory_lock_failure.
std::optional<platform::MemoryLockStatus> ApplyMemoryPolicy(const RuntimeConfig& config);

} // namespace sf::orchestrator
