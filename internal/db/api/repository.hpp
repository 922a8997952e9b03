#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/experiment_record.hpp"
#include "internal/db/model/program_record.hpp"
#include "internal/db/model/tombstone_record.hpp"

namespace evolve::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a read-write Transaction
  - Reads inside a transaction see its writes
  - Writes return Result; reads throw util::StorageError on backend failure

  The DB is the source of truth for:
    programs (code, lineage, metrics)
    tombstones of pruned programs
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(AccessMode mode = AccessMode::kReadWrite) = 0;

  // ---------------------------------------------------------------------
  // Programs
  // ---------------------------------------------------------------------

  virtual Result InsertProgram(Transaction&, const model::ProgramRecord&) = 0;

  virtual std::optional<model::ProgramRecord> GetProgram(Transaction&, const std::string& id) = 0;

  // Unordered; ranking is the store's job.
  virtual std::vector<model::ProgramRecord> ListPrograms(Transaction&, const ProgramFilter& filter) = 0;

  // NotFound when the id is not live.
  virtual Result UpdateMetrics(Transaction&, const std::string& id, const evolve::model::FitnessMetrics& metrics) = 0;

  virtual Result DeletePrograms(Transaction&, const std::vector<std::string>& ids) = 0;

  virtual std::uint64_t CountPrograms(Transaction&, const std::optional<std::string>& experiment) = 0;

  virtual std::vector<model::ExperimentRecord> ListExperiments(Transaction&) = 0;

  // Largest created_at_us ever recorded, live or pruned.
  virtual std::optional<std::int64_t> MaxCreatedAt(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Tombstones
  // ---------------------------------------------------------------------

  virtual Result InsertTombstone(Transaction&, const model::TombstoneRecord&) = 0;

  virtual std::optional<model::TombstoneRecord> GetTombstone(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Lifecycle
  // ---------------------------------------------------------------------

  // Push buffered state to durable storage. No-op for volatile backends.
  virtual void Flush() = 0;
};

} // namespace evolve::db
