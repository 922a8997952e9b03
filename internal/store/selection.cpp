#include "internal/store/selection.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <tuple>

#include "internal/model/metric.hpp"
#include "internal/store/ranking.hpp"
#include "internal/util/errors.hpp"

namespace evolve::store {

namespace {

bool IsRatio(double value) {
  return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

std::optional<model::Program> PickUniform(std::vector<model::Program>& pool, std::size_t size, Rng& rng) {
  if (size == 0) {
    return std::nullopt;
  }
  std::uniform_int_distribution<std::size_t> pick(0, size - 1);
  return std::move(pool[pick(rng)]);
}

} // namespace

SampleStrategy ParseSampleStrategy(std::string_view name) {
  if (name == "elite") return SampleStrategy::kElite;
  if (name == "exploit") return SampleStrategy::kExploit;
  if (name == "explore") return SampleStrategy::kExplore;
  throw util::InvalidArgument("unknown sampling strategy: " + std::string(name));
}

void ValidateMix(const SelectionMix& mix) {
  if (!IsRatio(mix.elite_ratio)) {
    throw util::InvalidArgument("elite_ratio must be within [0, 1]");
  }
  if (!IsRatio(mix.exploration_ratio)) {
    throw util::InvalidArgument("exploration_ratio must be within [0, 1]");
  }
  if (mix.elite_ratio + mix.exploration_ratio > 1.0) {
    throw util::InvalidArgument("elite_ratio + exploration_ratio must be <= 1");
  }
}

SampleStrategy ChooseStrategy(double r, const SelectionMix& mix) {
  if (r < mix.elite_ratio) return SampleStrategy::kElite;
  if (r < 1.0 - mix.exploration_ratio) return SampleStrategy::kExploit;
  return SampleStrategy::kExplore;
}

std::size_t EliteCount(std::size_t scored) {
  if (scored == 0) return 0;
  const auto top = static_cast<std::size_t>(std::floor(static_cast<double>(scored) * kEliteFraction));
  return std::max<std::size_t>(1, top);
}

std::vector<double> ExploitWeights(const std::vector<double>& fitness) {
  if (fitness.empty()) return {};

  const auto [lo, hi] = std::minmax_element(fitness.begin(), fitness.end());
  const double floor   = *lo;

  std::vector<double> weights;
  weights.reserve(fitness.size());
  double total = 0.0;
  for (double f : fitness) {
    weights.push_back(f - floor + kExploitEpsilon);
    total += weights.back();
  }
  if (std::isfinite(total)) return weights;

  // Spread or sum overflowed: rescale to [0, 1] using halves, which cannot overflow.
  const double half_range = *hi / 2 - floor / 2;
  for (std::size_t i = 0; i < fitness.size(); ++i) {
    weights[i] = (fitness[i] / 2 - floor / 2) / half_range + kExploitEpsilon;
  }
  return weights;
}

std::optional<model::Program> Select(SampleStrategy strategy, std::vector<model::Program> candidates, Rng& rng) {
  // Backends return rows unordered; fix the order so a seeded rng replays.
  std::sort(candidates.begin(), candidates.end(), [](const model::Program& a, const model::Program& b) {
    return std::tie(a.created_at, a.id) < std::tie(b.created_at, b.id);
  });

  switch (strategy) {
    case SampleStrategy::kElite: {
      auto ranked = RankByMetric(std::move(candidates), model::kPrimaryMetric);
      return PickUniform(ranked, EliteCount(ranked.size()), rng);
    }

    case SampleStrategy::kExploit: {
      std::erase_if(candidates, [](const model::Program& p) { return !p.IsScored(); });
      if (candidates.empty()) return std::nullopt;

      std::vector<double> fitness;
      fitness.reserve(candidates.size());
      for (const auto& p : candidates) {
        fitness.push_back(*model::MetricValue(p, model::kPrimaryMetric));
      }

      const auto                        weights = ExploitWeights(fitness);
      std::discrete_distribution<std::size_t> pick(weights.begin(), weights.end());
      return std::move(candidates[pick(rng)]);
    }

    case SampleStrategy::kExplore:
      return PickUniform(candidates, candidates.size(), rng);
  }
  return std::nullopt;
}

} // namespace evolve::store
