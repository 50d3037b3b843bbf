#pragma once

namespace snapshot::db {

/*
  Unit of work over the job table. Writes become visible to other
  transactions on Commit(); a transaction dropped without Commit() is
  rolled back.

  The memory backend commits optimistically and throws when another
  transaction committed first. SQLite holds the write lock from Begin
  (BEGIN IMMEDIATE), so a second Begin on the same connection throws.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;
};

} // namespace snapshot::db
