#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace evolve::db::model {

// Aggregate over live programs of one experiment.
struct ExperimentRecord {
  std::string name;

  std::uint64_t count = 0;

  // absent when nothing in the experiment is scored
  std::optional<double> best_calmar;

  // earliest created_at_us in the experiment
  std::int64_t first_created_at_us = 0;
};

} // namespace evolve::db::model
