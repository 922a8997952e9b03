#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace evolve::db::sqlite {

/*
  SQLite transaction wrapper.

  Read-write uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Read-only uses BEGIN DEFERRED and sees one snapshot.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, AccessMode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  AccessMode Mode() const override { return mode_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  AccessMode mode_;
  bool committed_ = false;
  bool finished_ = false;
};

}
