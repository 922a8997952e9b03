#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/model/fitness.hpp"
#include "internal/model/program.hpp"

namespace evolve::model {

enum class Metric : std::uint8_t {
  kCalmar = 0,
  kSharpe,
  kCagr,
  kMaxDrawdown,
  kTotalReturn,
  kWinRate,
  kPsr,
  kNetSharpe,
};

// Primary fitness for elite sampling, exploit weights and pruning.
inline constexpr Metric kPrimaryMetric = Metric::kCalmar;

constexpr std::string_view ToString(Metric metric) {
  switch (metric) {
    case Metric::kCalmar:
      return "calmar";
    case Metric::kSharpe:
      return "sharpe";
    case Metric::kCagr:
      return "cagr";
    case Metric::kMaxDrawdown:
      return "max_dd";
    case Metric::kTotalReturn:
      return "total_return";
    case Metric::kWinRate:
      return "win_rate";
    case Metric::kPsr:
      return "psr";
    case Metric::kNetSharpe:
    default:
      return "net_sharpe";
  }
}

// Throws util::InvalidArgument for names that map to no field.
Metric ParseMetric(std::string_view name);

std::optional<double> MetricValue(const FitnessMetrics& metrics, Metric metric);

// nullopt for pending programs and unset optional fields.
std::optional<double> MetricValue(const Program& program, Metric metric);

} // namespace evolve::model
