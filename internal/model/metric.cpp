#include "internal/model/metric.hpp"

#include <array>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace evolve::model {

namespace {

constexpr std::array<std::pair<std::string_view, Metric>, 11> kMetricNames = {{
    {"calmar", Metric::kCalmar},
    {"calmar_ratio", Metric::kCalmar},
    {"sharpe", Metric::kSharpe},
    {"sharpe_ratio", Metric::kSharpe},
    {"cagr", Metric::kCagr},
    {"max_dd", Metric::kMaxDrawdown},
    {"max_drawdown", Metric::kMaxDrawdown},
    {"total_return", Metric::kTotalReturn},
    {"win_rate", Metric::kWinRate},
    {"psr", Metric::kPsr},
    {"net_sharpe", Metric::kNetSharpe},
}};

} // namespace

Metric ParseMetric(std::string_view name) {
  for (const auto& [key, metric] : kMetricNames) {
    if (key == name) {
      return metric;
    }
  }
  throw util::InvalidArgument("unknown metric: " + std::string(name));
}

std::optional<double> MetricValue(const FitnessMetrics& metrics, Metric metric) {
  switch (metric) {
    case Metric::kCalmar:
      return metrics.calmar_ratio;
    case Metric::kSharpe:
      return metrics.sharpe_ratio;
    case Metric::kCagr:
      return metrics.cagr;
    case Metric::kMaxDrawdown:
      return metrics.max_drawdown;
    case Metric::kTotalReturn:
      return metrics.total_return;
    case Metric::kWinRate:
      return metrics.win_rate;
    case Metric::kPsr:
      return metrics.psr;
    case Metric::kNetSharpe:
      return metrics.net_sharpe;
  }
  return std::nullopt;
}

std::optional<double> MetricValue(const Program& program, Metric metric) {
  const auto* metrics = program.Metrics();
  if (!metrics) {
    return std::nullopt;
  }
  return MetricValue(*metrics, metric);
}

} // namespace evolve::model
