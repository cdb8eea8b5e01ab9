#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace sf::core {

enum class QualityTier : uint8_t { kPoor = 0, kFair = 1, kGood = 2, kExcellent = 3 };

std::string_view QualityTierName(QualityTier tier) noexcept;
std::optional<QualityTier> ParseQualityTier(std::string_view text) noexcept;

// Statistical summary of one byte buffer. All fields are zero for an empty
// buffer, whose tier is kPoor.
struct QualityMetrics {
  size_t sample_bytes{0};
  double shannon_entropy{0.0};      // bits per byte, 0..8
  double chi_square{0.0};           // 255 degrees of freedom
  double chi_square_p_value{0.0};
  double arithmetic_mean{0.0};      // ideal 127.5
  double monte_carlo_pi{0.0};
  double monte_carlo_error_pct{0.0};
  double serial_correlation{0.0};   // ideal 0
  QualityTier tier{QualityTier::kPoor};
};

// Deterministic: the same bytes always give the same metrics.
QualityMetrics ValidateEntropy(std::span<const uint8_t> bytes);

// EXCELLENT: H >= 7.99 and 0.10 <= p <= 0.90
// GOOD:      H >= 7.90 and 0.05 <= p <= 0.95
// FAIR:      H >= 7.50 and 0.01 <= p <= 0.99
QualityTier ClassifyQuality(double shannon_entropy, double chi_square_p_value) noexcept;

inline bool MeetsQuality(QualityTier tier, QualityTier minimum) noexcept {
  return static_cast<uint8_t>(tier) >= static_cast<uint8_t>(minimum);
}

// Upper regularized incomplete gamma Q(a, x).
double RegularizedGammaQ(double a, double x) noexcept;

} // namespace sf::core
