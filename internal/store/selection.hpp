#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

#include "internal/model/program.hpp"

namespace evolve::store {

enum class SampleStrategy : std::uint8_t {
  kElite = 0,
  kExploit,
  kExplore,
};

constexpr std::string_view ToString(SampleStrategy strategy) {
  switch (strategy) {
    case SampleStrategy::kElite:
      return "elite";
    case SampleStrategy::kExploit:
      return "exploit";
    case SampleStrategy::kExplore:
    default:
      return "explore";
  }
}

// Throws util::InvalidArgument for anything but elite/exploit/explore.
SampleStrategy ParseSampleStrategy(std::string_view name);

// Share of the scored population eligible for elite sampling.
inline constexpr double kEliteFraction = 0.1;

// Keeps exploit weights strictly positive when all fitness values are equal.
inline constexpr double kExploitEpsilon = 1e-6;

/*
  Probabilities used by SampleParent to pick a policy.
  exploit gets whatever remains after elite and explore.
*/
struct SelectionMix {
  double elite_ratio       = 0.1;
  double exploration_ratio = 0.2;
};

void ValidateMix(const SelectionMix& mix);

// r in [0, 1)
SampleStrategy ChooseStrategy(double r, const SelectionMix& mix);

// max(1, floor(scored * kEliteFraction)); 0 for an empty population
std::size_t EliteCount(std::size_t scored);

// w_i = f_i - min(f) + kExploitEpsilon, rescaled to [0, 1] + kExploitEpsilon when that overflows
std::vector<double> ExploitWeights(const std::vector<double>& fitness);

using Rng = std::mt19937_64;

/*
  Picks one program from candidates according to strategy.

  candidates: everything in scope, pending included; elite and exploit
  only consider scored programs. nullopt when nothing is eligible.
*/
std::optional<model::Program> Select(SampleStrategy strategy, std::vector<model::Program> candidates, Rng& rng);

} // namespace evolve::store
