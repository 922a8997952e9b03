#pragma once

#include <string>
#include <vector>

namespace evolve::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and the version bookkeeping.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // 0 for a fresh database
  virtual int CurrentVersion() = 0;

  virtual void RecordVersion(int version) = 0;
};

/*
  Runs migrations in order.
  Migration i (0-based) brings the schema to version i + 1; already
  applied versions are skipped.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Schema history of the program store.
const std::vector<std::string>& ProgramStoreMigrations();

} // namespace evolve::db::sql
