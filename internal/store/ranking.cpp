#include "internal/store/ranking.hpp"

#include <algorithm>
#include <tuple>

namespace evolve::store {

namespace {

bool EarlierFirst(const model::Program& a, const model::Program& b) {
  return std::tie(a.created_at, a.id) < std::tie(b.created_at, b.id);
}

} // namespace

std::vector<model::Program> RankByMetric(std::vector<model::Program> programs, model::Metric metric) {
  std::erase_if(programs, [metric](const model::Program& p) { return !model::MetricValue(p, metric).has_value(); });

  std::sort(programs.begin(), programs.end(), [metric](const model::Program& a, const model::Program& b) {
    const double va = *model::MetricValue(a, metric);
    const double vb = *model::MetricValue(b, metric);
    if (va != vb) return va > vb;
    return EarlierFirst(a, b);
  });
  return programs;
}

void SortForSurvival(std::vector<model::Program>& programs) {
  std::sort(programs.begin(), programs.end(), [](const model::Program& a, const model::Program& b) {
    const auto va = model::MetricValue(a, model::kPrimaryMetric);
    const auto vb = model::MetricValue(b, model::kPrimaryMetric);
    if (va.has_value() != vb.has_value()) return va.has_value();
    if (va && *va != *vb) return *va > *vb;
    return EarlierFirst(a, b);
  });
}

std::vector<std::string> SelectPruneVictims(std::vector<model::Program> live, std::size_t population_size, std::size_t archive_size) {
  if (live.size() <= population_size) {
    return {};
  }

  SortForSurvival(live);

  const std::size_t protected_count = std::min(archive_size, live.size());
  const std::size_t excess          = live.size() - population_size;
  const std::size_t removable       = std::min(excess, live.size() - protected_count);

  // lowest ranked first
  std::vector<std::string> victims;
  victims.reserve(removable);
  for (std::size_t i = 0; i < removable; ++i) {
    victims.push_back(live[live.size() - 1 - i].id);
  }
  return victims;
}

} // namespace evolve::store
