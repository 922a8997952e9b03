#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "internal/model/fitness.hpp"
#include "internal/util/time.hpp"

namespace evolve::model {

// Inserted but not evaluated yet.
struct Pending {
  bool operator==(const Pending&) const = default;
};

struct Scored {
  FitnessMetrics metrics;

  bool operator==(const Scored&) const = default;
};

using Evaluation = std::variant<Pending, Scored>;

struct Program {
  std::string                id;
  std::string                code;
  std::optional<std::string> parent_id;

  // 0 for roots, parent.generation + 1 otherwise. Derived by the store.
  std::uint32_t generation = 0;

  std::optional<std::string> experiment;
  Evaluation                 evaluation = Pending{};

  util::TimePoint created_at{};

  bool IsScored() const {
    return std::holds_alternative<Scored>(evaluation);
  }

  // nullptr while pending
  const FitnessMetrics* Metrics() const {
    const auto* scored = std::get_if<Scored>(&evaluation);
    return scored ? &scored->metrics : nullptr;
  }
};

} // namespace evolve::model
