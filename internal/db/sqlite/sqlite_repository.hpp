#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace evolve::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin(AccessMode mode = AccessMode::kReadWrite) override;

  Result InsertProgram(Transaction&, const model::ProgramRecord&) override;
  std::optional<model::ProgramRecord> GetProgram(Transaction&, const std::string&) override;
  std::vector<model::ProgramRecord> ListPrograms(Transaction&, const ProgramFilter&) override;
  Result UpdateMetrics(Transaction&, const std::string&, const evolve::model::FitnessMetrics&) override;
  Result DeletePrograms(Transaction&, const std::vector<std::string>&) override;
  std::uint64_t CountPrograms(Transaction&, const std::optional<std::string>& experiment) override;
  std::vector<model::ExperimentRecord> ListExperiments(Transaction&) override;
  std::optional<std::int64_t> MaxCreatedAt(Transaction&) override;

  Result InsertTombstone(Transaction&, const model::TombstoneRecord&) override;
  std::optional<model::TombstoneRecord> GetTombstone(Transaction&, const std::string&) override;

  void Flush() override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static SqliteTransaction& WriteTX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
