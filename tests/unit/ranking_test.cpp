#include "internal/store/ranking.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using evolve::model::FitnessMetrics;
using evolve::model::Metric;
using evolve::model::Program;
using evolve::model::Scored;
using evolve::store::RankByMetric;
using evolve::store::SelectPruneVictims;
using evolve::store::SortForSurvival;

Program MakeProgram(const std::string& id, int created, std::optional<double> calmar, std::optional<double> psr = std::nullopt) {
  Program program;
  program.id         = id;
  program.code       = "code";
  program.created_at = evolve::util::TimePoint{} + std::chrono::microseconds(created);
  if (calmar) {
    FitnessMetrics metrics;
    metrics.calmar_ratio = *calmar;
    metrics.sharpe_ratio = -*calmar;
    metrics.psr          = psr;
    program.evaluation   = Scored{metrics};
  }
  return program;
}

std::vector<std::string> Ids(const std::vector<Program>& programs) {
  std::vector<std::string> out;
  for (const auto& p : programs) out.push_back(p.id);
  return out;
}

void TestRankByMetricDropsPending() {
  auto ranked = RankByMetric({MakeProgram("pending", 0, std::nullopt), MakeProgram("low", 1, 1.0), MakeProgram("high", 2, 3.0)},
                             Metric::kCalmar);
  assert((Ids(ranked) == std::vector<std::string>{"high", "low"}));

  auto by_sharpe = RankByMetric({MakeProgram("low", 1, 1.0), MakeProgram("high", 2, 3.0)}, Metric::kSharpe);
  assert((Ids(by_sharpe) == std::vector<std::string>{"low", "high"}));
}

void TestRankByOptionalMetricDropsUnset() {
  auto ranked = RankByMetric({MakeProgram("no_psr", 0, 5.0), MakeProgram("psr", 1, 1.0, 0.8)}, Metric::kPsr);
  assert((Ids(ranked) == std::vector<std::string>{"psr"}));
}

void TestTiesBreakByCreationThenId() {
  auto ranked = RankByMetric({MakeProgram("c", 5, 2.0), MakeProgram("b", 1, 2.0), MakeProgram("a", 1, 2.0)}, Metric::kCalmar);
  assert((Ids(ranked) == std::vector<std::string>{"a", "b", "c"}));
}

void TestSurvivalOrderPutsPendingLast() {
  std::vector<Program> programs = {
      MakeProgram("pending_old", 0, std::nullopt),
      MakeProgram("negative", 1, -5.0),
      MakeProgram("pending_new", 2, std::nullopt),
      MakeProgram("good", 3, 4.0),
  };
  SortForSurvival(programs);
  assert((Ids(programs) == std::vector<std::string>{"good", "negative", "pending_old", "pending_new"}));
}

void TestVictimsRespectArchive() {
  std::vector<Program> live = {
      MakeProgram("a", 0, 1.0),
      MakeProgram("b", 1, 5.0),
      MakeProgram("c", 2, 2.0),
      MakeProgram("d", 3, 0.5),
  };

  assert((SelectPruneVictims(live, 3, 1) == std::vector<std::string>{"d"}));
  assert((SelectPruneVictims(live, 2, 1) == std::vector<std::string>{"d", "a"}));
  assert(SelectPruneVictims(live, 4, 1).empty());

  // only the archived program may survive
  auto victims = SelectPruneVictims(live, 1, 1);
  assert(victims.size() == 3);
  assert(std::find(victims.begin(), victims.end(), "b") == victims.end());
}

void TestVictimsNeverTouchArchiveEvenWhenPending() {
  std::vector<Program> live = {
      MakeProgram("p1", 0, std::nullopt),
      MakeProgram("p2", 1, std::nullopt),
      MakeProgram("p3", 2, std::nullopt),
  };

  // archive larger than the scored set protects pending programs too
  auto victims = SelectPruneVictims(live, 1, 2);
  assert((victims == std::vector<std::string>{"p3"}));
}

} // namespace

int main() {
  TestRankByMetricDropsPending();
  TestRankByOptionalMetricDropsUnset();
  TestTiesBreakByCreationThenId();
  TestSurvivalOrderPutsPendingLast();
  TestVictimsRespectArchive();
  TestVictimsNeverTouchArchiveEvenWhenPending();

  std::cout << "evolve_store_unit_ranking: pass\n";
  return 0;
}
