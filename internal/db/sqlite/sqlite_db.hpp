#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace evolve::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per store. Transactions hold Mutex() for their whole
  lifetime, so statements from different threads never interleave
  inside one BEGIN/COMMIT.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& Mutex() {
    return mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, synchronous, busy timeout)
  void Configure();

  // Fold the WAL back into the main database file.
  void Checkpoint();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  bool        wal_mode_;
  std::mutex  mutex_;
};

/*
  Owns one prepared statement; finalized on scope exit.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* Get() const {
    return stmt_;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace evolve::db::sqlite
