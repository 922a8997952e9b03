#pragma once

#include <optional>
#include <string>

namespace evolve::db {

struct ProgramFilter {
  // nullopt selects every experiment, including programs without one
  std::optional<std::string> experiment;

  // skip pending programs
  bool scored_only = false;

  std::optional<std::string> id_prefix;
};

} // namespace evolve::db
