#include "internal/db/sql/migrations.hpp"

#include "internal/observability/logging.hpp"

namespace evolve::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  const int current = executor.CurrentVersion();

  for (int version = current + 1; version <= static_cast<int>(ordered_sql.size()); ++version) {
    executor.ExecuteSQL(ordered_sql[version - 1]);
    executor.RecordVersion(version);
    EVOLVE_LOG_INFO("Applied schema migration", {observability::IntField("version", version)});
  }
}

const std::vector<std::string>& ProgramStoreMigrations() {
  static const std::vector<std::string> kMigrations = {
      // 1: programs + tombstones
      "CREATE TABLE IF NOT EXISTS programs ("
      " id TEXT PRIMARY KEY,"
      " code TEXT NOT NULL,"
      " parent_id TEXT,"
      " generation INTEGER NOT NULL DEFAULT 0,"
      " experiment TEXT,"
      " sharpe REAL, calmar REAL, max_dd REAL, cagr REAL, total_return REAL,"
      " trade_count INTEGER, win_rate REAL,"
      " created_at_us INTEGER NOT NULL);"
      "CREATE INDEX IF NOT EXISTS idx_programs_calmar ON programs(calmar DESC);"
      "CREATE INDEX IF NOT EXISTS idx_programs_sharpe ON programs(sharpe DESC);"
      "CREATE INDEX IF NOT EXISTS idx_programs_experiment ON programs(experiment);"
      "CREATE TABLE IF NOT EXISTS program_tombstones ("
      " id TEXT PRIMARY KEY,"
      " generation INTEGER NOT NULL,"
      " experiment TEXT,"
      " created_at_us INTEGER NOT NULL,"
      " pruned_at_us INTEGER NOT NULL);",

      // 2: extended fitness columns
      "ALTER TABLE programs ADD COLUMN psr REAL;"
      "ALTER TABLE programs ADD COLUMN net_sharpe REAL;",
  };
  return kMigrations;
}

} // namespace evolve::db::sql
