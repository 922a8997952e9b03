#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace evolve::db::model {

/*
  Left behind by pruning so a pruned id still resolves as a parent.
  Code and metrics are not kept.
*/

struct TombstoneRecord {
  std::string id;

  std::uint32_t generation = 0;

  std::optional<std::string> experiment;

  // epoch microseconds
  std::int64_t created_at_us = 0;
  std::int64_t pruned_at_us  = 0;

  bool operator==(const TombstoneRecord&) const = default;
};

} // namespace evolve::db::model
