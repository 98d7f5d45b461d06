#pragma once

namespace rowcast::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - Destructor rolls back if neither Commit() nor Rollback() ran

  SQLite:   BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory:   snapshot copy-on-write
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsFinished() const = 0;
};

} // namespace rowcast::db
