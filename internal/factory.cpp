#include "factory.hpp"

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace evolve::factory {

using observability::StringField;

namespace {

/*
  Applies each migration and its version row in one transaction, so a
  failed migration leaves the recorded version untouched.
*/
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
    db_->Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");
  }

  void ExecuteSQL(const std::string& sql) override {
    db_->Exec("BEGIN IMMEDIATE;");
    try {
      db_->Exec(sql);
    } catch (const util::StorageError&) {
      db_->Exec("ROLLBACK;");
      throw;
    }
  }

  int CurrentVersion() override {
    db::sqlite::Statement st(db_->Handle(), "SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    if (sqlite3_step(st.Get()) != SQLITE_ROW) {
      throw util::StorageError(std::string("read schema version: ") + sqlite3_errmsg(db_->Handle()));
    }
    return sqlite3_column_int(st.Get(), 0);
  }

  void RecordVersion(int version) override {
    db::sqlite::Statement st(db_->Handle(), "INSERT INTO schema_migrations(version, applied_at_ms) VALUES(?, ?);");
    sqlite3_bind_int(st.Get(), 1, version);
    sqlite3_bind_int64(st.Get(), 2, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now())));

    if (sqlite3_step(st.Get()) != SQLITE_DONE) {
      const std::string msg = sqlite3_errmsg(db_->Handle());
      db_->Exec("ROLLBACK;");
      throw util::StorageError("record schema version: " + msg);
    }
    db_->Exec("COMMIT;");
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const evolve::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw util::InvalidArgument("database.sqlite.path must not be empty");
    }

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    {
      std::scoped_lock        lock(sqlite_db->Mutex());
      SqliteMigrationExecutor executor(sqlite_db);
      db::sql::RunMigrations(executor, db::sql::ProgramStoreMigrations());
    }

    EVOLVE_LOG_INFO("Opened sqlite repository", {StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  EVOLVE_LOG_INFO("Using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

store::StoreOptions BuildStoreOptions(const evolve::runtime::config::RuntimeConfig& config) {
  store::StoreOptions options;

  const auto& population = config.population();
  if (population.has_population_size()) options.population_size = population.population_size();
  if (population.has_archive_size()) options.archive_size = population.archive_size();

  const auto& selection = config.selection();
  if (selection.has_elite_ratio()) options.mix.elite_ratio = selection.elite_ratio();
  if (selection.has_exploration_ratio()) options.mix.exploration_ratio = selection.exploration_ratio();
  if (selection.has_random_seed()) options.random_seed = selection.random_seed();

  store::ValidateOptions(options);
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const evolve::runtime::config::RuntimeConfig& config) {
  // validated before the database is opened
  auto options = BuildStoreOptions(config);

  Application app;
  app.repository = BuildRepository(config);
  app.store      = std::make_shared<store::ProgramStore>(app.repository, std::move(options));
  return app;
}

} // namespace evolve::factory
