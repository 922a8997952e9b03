#include "internal/model/metric.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "internal/util/errors.hpp"

namespace {

using evolve::model::FitnessMetrics;
using evolve::model::Metric;
using evolve::model::MetricValue;
using evolve::model::ParseMetric;

void TestAliasesResolveToSameField() {
  assert(ParseMetric("calmar") == Metric::kCalmar);
  assert(ParseMetric("calmar_ratio") == Metric::kCalmar);
  assert(ParseMetric("sharpe") == Metric::kSharpe);
  assert(ParseMetric("sharpe_ratio") == Metric::kSharpe);
  assert(ParseMetric("max_dd") == Metric::kMaxDrawdown);
  assert(ParseMetric("max_drawdown") == Metric::kMaxDrawdown);
  assert(ParseMetric("cagr") == Metric::kCagr);
  assert(ParseMetric("total_return") == Metric::kTotalReturn);
  assert(ParseMetric("win_rate") == Metric::kWinRate);
  assert(ParseMetric("psr") == Metric::kPsr);
  assert(ParseMetric("net_sharpe") == Metric::kNetSharpe);
}

void TestUnknownMetricThrows() {
  for (const char* name : {"", "Calmar", "sortino", "trade_count"}) {
    bool threw = false;
    try {
      (void)ParseMetric(name);
    } catch (const evolve::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestCanonicalNamesRoundTrip() {
  for (auto metric : {Metric::kCalmar, Metric::kSharpe, Metric::kCagr, Metric::kMaxDrawdown, Metric::kTotalReturn, Metric::kWinRate,
                      Metric::kPsr, Metric::kNetSharpe}) {
    assert(ParseMetric(evolve::model::ToString(metric)) == metric);
  }
}

void TestMetricValueForPendingAndOptional() {
  evolve::model::Program pending;
  assert(!MetricValue(pending, Metric::kCalmar).has_value());

  FitnessMetrics metrics;
  metrics.calmar_ratio = 2.5;
  metrics.max_drawdown = -0.3;
  assert(MetricValue(metrics, Metric::kCalmar) == 2.5);
  assert(MetricValue(metrics, Metric::kMaxDrawdown) == -0.3);
  assert(!MetricValue(metrics, Metric::kWinRate).has_value());

  metrics.win_rate = 0.55;
  assert(MetricValue(metrics, Metric::kWinRate) == 0.55);

  evolve::model::Program scored;
  scored.evaluation = evolve::model::Scored{metrics};
  assert(MetricValue(scored, Metric::kCalmar) == 2.5);
}

void TestIsFinite() {
  FitnessMetrics metrics;
  assert(evolve::model::IsFinite(metrics));

  metrics.sharpe_ratio = std::numeric_limits<double>::infinity();
  assert(!evolve::model::IsFinite(metrics));

  metrics.sharpe_ratio = 1.0;
  metrics.net_sharpe   = std::nan("");
  assert(!evolve::model::IsFinite(metrics));
}

} // namespace

int main() {
  TestAliasesResolveToSameField();
  TestUnknownMetricThrows();
  TestCanonicalNamesRoundTrip();
  TestMetricValueForPendingAndOptional();
  TestIsFinite();

  std::cout << "evolve_store_unit_metric: pass\n";
  return 0;
}
