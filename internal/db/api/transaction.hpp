#pragma once

namespace evolve::db {

enum class AccessMode {
  kReadOnly,
  kReadWrite,
};

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Reads observe one consistent snapshot for the lifetime of the transaction

  SQLite: BEGIN IMMEDIATE (read-write) / BEGIN DEFERRED (read-only)
  Memory: snapshot copy-on-write
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  virtual AccessMode Mode() const = 0;
};

} // namespace evolve::db
