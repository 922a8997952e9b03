#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/fitness.hpp"

namespace evolve::db::model {

/*
  Persistent program row.

  IMPORTANT:
  - metrics present <=> program is scored (calmar column non-null)
  - generation is computed by the store before insert, never recomputed here
*/

struct ProgramRecord {
  std::string id;  // canonical UUID text

  std::string code;

  std::optional<std::string> parent_id;

  std::uint32_t generation = 0;

  std::optional<std::string> experiment;

  std::optional<evolve::model::FitnessMetrics> metrics;

  // microseconds since epoch, strictly increasing per store
  std::int64_t created_at_us = 0;

  bool operator==(const ProgramRecord&) const = default;
};

} // namespace evolve::db::model
