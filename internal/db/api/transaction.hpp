#pragma once

namespace jobguard::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws util::TransactionConflict when a concurrent writer
    invalidated this transaction; the caller may retry from Begin()

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work (SERIALIZABLE)
  Memory: snapshot copy-on-write, version checked at commit
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
};

}
