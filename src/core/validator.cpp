#include "sf/core/validator.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <numbers>

namespace sf::core {

namespace {

constexpr double kDegreesOfFreedom = 255.0;
constexpr int kGammaMaxIterations = 1000;
constexpr double kGammaEpsilon = 1e-15;
constexpr double kGammaTiny = 1e-300;

// Lower series for P(a, x); converges for x < a + 1.
double GammaPSeries(double a, double x) noexcept {
  double sum = 1.0 / a;
  double term = sum;
  double ap = a;
  for (int n = 0; n < kGammaMaxIterations; ++n) {
    ap += 1.0;
    term *= x / ap;
    sum += term;
    if (std::fabs(term) < std::fabs(sum) * kGammaEpsilon) {
      break;
    }
  }
  return sum * std::exp(-x + a * std::log(x) - std::lgamma(a));
}

// Lentz continued fraction for Q(a, x); converges for x >= a + 1.
double GammaQContinuedFraction(double a, double x) noexcept {
  double b = x + 1.0 - a;
  double c = 1.0 / kGammaTiny;
  double d = 1.0 / b;
  double h = d;
  for (int i = 1; i <= kGammaMaxIterations; ++i) {
    const double an = -i * (i - a);
    b += 2.0;
    d = an * d + b;
    if (std::fabs(d) < kGammaTiny) {
      d = kGammaTiny;
    }
    c = b + an / c;
    if (std::fabs(c) < kGammaTiny) {
      c = kGammaTiny;
    }
    d = 1.0 / d;
    const double delta = d * c;
    h *= delta;
    if (std::fabs(delta - 1.0) < kGammaEpsilon) {
      break;
    }
  }
  return std::exp(-x + a * std::log(x) - std::lgamma(a)) * h;
}

} // namespace

double RegularizedGammaQ(double a, double x) noexcept {
  if (a <= 0.0 || x < 0.0 || std::isnan(x)) {
    return 0.0;
  }
  if (x == 0.0) {
    return 1.0;
  }
  if (x < a + 1.0) {
    return std::clamp(1.0 - GammaPSeries(a, x), 0.0, 1.0);
  }
  return std::clamp(GammaQContinuedFraction(a, x), 0.0, 1.0);
}

std::string_view QualityTierName(QualityTier tier) noexcept {
  switch (tier) {
  case QualityTier::kExcellent:
    return "EXCELLENT";
  case QualityTier::kGood:
    return "GOOD";
  case QualityTier::kFair:
    return "FAIR";
  case QualityTier::kPoor:
    return "POOR";
  }
  return "POOR";
}

std::optional<QualityTier> ParseQualityTier(std::string_view text) noexcept {
  for (auto tier : {QualityTier::kExcellent, QualityTier::kGood, QualityTier::kFair, QualityTier::kPoor}) {
    const auto name = QualityTierName(tier);
    if (name.size() != text.size()) {
      continue;
    }
    bool match = true;
    for (size_t i = 0; i < name.size(); ++i) {
      char c = text[i];
      if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
      }
      if (c != name[i]) {
        match = false;
        break;
      }
    }
    if (match) {
      return tier;
    }
  }
  return std::nullopt;
}

QualityTier ClassifyQuality(double shannon_entropy, double p) noexcept {
  if (shannon_entropy >= 7.99 && p >= 0.10 && p <= 0.90) {
    return QualityTier::kExcellent;
  }
  if (shannon_entropy >= 7.9 && p >= 0.05 && p <= 0.95) {
    return QualityTier::kGood;
  }
  if (shannon_entropy >= 7.5 && p >= 0.01 && p <= 0.99) {
    return QualityTier::kFair;
  }
  return QualityTier::kPoor;
}

QualityMetrics ValidateEntropy(std::span<const uint8_t> bytes) {
  QualityMetrics metrics;
  if (bytes.empty()) {
    return metrics;
  }
  const size_t n = bytes.size();
  const double total = static_cast<double>(n);
  metrics.sample_bytes = n;

  std::array<uint64_t, 256> counts{};
  double sum = 0.0;
  for (uint8_t b : bytes) {
    ++counts[b];
    sum += b;
  }
  metrics.arithmetic_mean = sum / total;

  const double expected = total / 256.0;
  double entropy = 0.0;
  double chi = 0.0;
  for (uint64_t count : counts) {
    if (count > 0) {
      const double p = static_cast<double>(count) / total;
      entropy -= p * std::log2(p);
    }
    const double diff = static_cast<double>(count) - expected;
    chi += diff * diff / expected;
  }
  metrics.shannon_entropy = entropy;
  metrics.chi_square = chi;
  metrics.chi_square_p_value = RegularizedGammaQ(kDegreesOfFreedom / 2.0, chi / 2.0);

  // Monte Carlo: successive non-overlapping pairs as points in the unit square.
  const size_t pairs = n / 2;
  if (pairs > 0) {
    size_t inside = 0;
    for (size_t i = 0; i < pairs; ++i) {
      const double x = (static_cast<double>(bytes[2 * i]) + 0.5) / 256.0;
      const double y = (static_cast<double>(bytes[2 * i + 1]) + 0.5) / 256.0;
      if (x * x + y * y <= 1.0) {
        ++inside;
      }
    }
    metrics.monte_carlo_pi = 4.0 * static_cast<double>(inside) / static_cast<double>(pairs);
    metrics.monte_carlo_error_pct =
        std::fabs(metrics.monte_carlo_pi - std::numbers::pi) / std::numbers::pi * 100.0;
  }

  // Cyclic lag-1 serial correlation.
  double t1 = 0.0;
  double t3 = 0.0;
  for (size_t i = 0; i < n; ++i) {
    const double u = bytes[i];
    const double next = bytes[(i + 1) % n];
    t1 += u * next;
    t3 += u * u;
  }
  const double t2 = sum * sum;
  const double denominator = total * t3 - t2;
  if (denominator == 0.0) {
    metrics.serial_correlation = 1.0; // constant buffer
  } else {
    metrics.serial_correlation = (total * t1 - t2) / denominator;
  }

  metrics.tier = ClassifyQuality(metrics.shannon_entropy, metrics.chi_square_p_value);
  return metrics;
}

} // namespace sf::core
