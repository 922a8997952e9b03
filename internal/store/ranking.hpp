#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/model/metric.hpp"
#include "internal/model/program.hpp"

namespace evolve::store {

/*
  Ordering rules shared by TopK, elite sampling and pruning.

  Every order is total: equal metric values fall back to earlier
  created_at, then to id.
*/

// Descending by metric. Programs without a value for it (pending, or an
// unset optional field) are dropped, never treated as zero.
std::vector<model::Program> RankByMetric(std::vector<model::Program> programs, model::Metric metric);

// Survival order: scored programs by primary metric descending, then all
// pending programs.
void SortForSurvival(std::vector<model::Program>& programs);

// Ids to delete so that at most population_size programs remain. The first
// archive_size programs in survival order are never selected.
std::vector<std::string> SelectPruneVictims(std::vector<model::Program> live, std::size_t population_size, std::size_t archive_size);

} // namespace evolve::store
