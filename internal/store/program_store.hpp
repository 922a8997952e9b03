#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/fitness.hpp"
#include "internal/model/program.hpp"
#include "internal/store/selection.hpp"
#include "internal/util/time.hpp"

namespace evolve::store {

struct StoreOptions {
  // Maximum live programs across all experiments.
  std::uint32_t population_size = 500;

  // Top-ranked programs pruning never removes. Must be < population_size.
  std::uint32_t archive_size = 50;

  SelectionMix mix;

  // Fixed seed makes Sample/SampleParent replayable.
  std::optional<std::uint64_t> random_seed;
};

// Throws util::InvalidArgument describing the first violated constraint.
void ValidateOptions(const StoreOptions& options);

struct SampledParent {
  SampleStrategy strategy;
  model::Program program;
};

struct ExperimentSummary {
  std::string           name;
  std::uint64_t         count = 0;
  std::optional<double> best_calmar;
  util::TimePoint       created_at{};
};

/*
  Durable, bounded population of evolved programs.

  Concurrency model:
  - Insert/UpdateMetrics/Prune/Close serialize on mutation_mutex_ and each
    runs as one read-write transaction, so an insert and the prune it
    triggers commit together.
  - Reads run in read-only transactions and never take mutation_mutex_;
    each read sees one committed snapshot.
*/
class ProgramStore {
 public:
  ProgramStore(std::shared_ptr<db::Repository> repository, StoreOptions options);

  ProgramStore(const ProgramStore&)            = delete;
  ProgramStore& operator=(const ProgramStore&) = delete;

  // Returns the new id. May prune other programs (or the new one, when it
  // ranks last) before returning.
  std::string Insert(const std::string& code, std::optional<model::FitnessMetrics> metrics = std::nullopt,
                     std::optional<std::string> parent_id = std::nullopt, std::optional<std::string> experiment = std::nullopt);

  void UpdateMetrics(const std::string& id, const model::FitnessMetrics& metrics);

  // nullopt for unknown and pruned ids
  std::optional<model::Program> Get(const std::string& id) const;

  std::vector<model::Program> TopK(std::size_t k, std::string_view metric = "calmar",
                                   const std::optional<std::string>& experiment = std::nullopt) const;

  std::optional<model::Program> Sample(std::string_view strategy = "exploit", const std::optional<std::string>& experiment = std::nullopt) const;
  std::optional<model::Program> Sample(SampleStrategy strategy, const std::optional<std::string>& experiment = std::nullopt) const;

  // Picks the policy from the configured SelectionMix, then samples.
  std::optional<SampledParent> SampleParent(const std::optional<std::string>& experiment = std::nullopt) const;

  // From id back to its root, stopping before a pruned parent.
  std::vector<model::Program> GetLineage(const std::string& id) const;

  std::uint64_t Count(const std::optional<std::string>& experiment = std::nullopt) const;

  std::size_t Prune();

  std::vector<ExperimentSummary> ListExperiments() const;

  // Exact id, else the single live id starting with prefix.
  std::optional<model::Program> FindByPrefix(const std::string& prefix) const;

  // Flushes the backend; every later call throws util::InvalidState.
  void Close();

  const StoreOptions& Options() const {
    return options_;
  }

 private:
  void         EnsureOpen() const;
  std::int64_t NextCreatedAtLocked();
  std::size_t  PruneLocked(db::Transaction& tx);

  std::uint32_t ResolveGeneration(db::Transaction& tx, const std::string& parent_id);

  std::shared_ptr<db::Repository> repository_;
  StoreOptions                    options_;

  mutable std::mutex mutation_mutex_;
  std::int64_t       last_created_at_us_ = 0;

  mutable std::mutex rng_mutex_;
  mutable Rng        rng_;

  std::atomic<bool> closed_{false};
};

} // namespace evolve::store
