#pragma once

#include <cstdint>
#include <optional>

namespace evolve::model {

/*
  Scalar performance snapshot produced by the external evaluator.

  Replaced as a whole by ProgramStore::UpdateMetrics, never merged.
*/
struct FitnessMetrics {
  double sharpe_ratio = 0.0;
  double calmar_ratio = 0.0;
  double max_drawdown = 0.0;
  double cagr         = 0.0;
  double total_return = 0.0;

  std::optional<std::int64_t> trade_count;
  std::optional<double>       win_rate;

  // probabilistic sharpe ratio
  std::optional<double> psr;
  // transaction-cost adjusted sharpe
  std::optional<double> net_sharpe;

  bool operator==(const FitnessMetrics&) const = default;
};

// Required fields must be finite; optional fields may be absent but not NaN/inf.
bool IsFinite(const FitnessMetrics& metrics);

} // namespace evolve::model
