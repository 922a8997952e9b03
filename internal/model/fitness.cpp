#include "internal/model/fitness.hpp"

#include <cmath>

namespace evolve::model {

namespace {

bool OptionalFinite(const std::optional<double>& value) {
  return !value || std::isfinite(*value);
}

} // namespace

bool IsFinite(const FitnessMetrics& metrics) {
  return std::isfinite(metrics.sharpe_ratio) && std::isfinite(metrics.calmar_ratio) && std::isfinite(metrics.max_drawdown) &&
         std::isfinite(metrics.cagr) && std::isfinite(metrics.total_return) && OptionalFinite(metrics.win_rate) &&
         OptionalFinite(metrics.psr) && OptionalFinite(metrics.net_sharpe);
}

} // namespace evolve::model
