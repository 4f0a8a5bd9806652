#pragma once

namespace arena::db {

/*
  Unit of work over the run repository.

  The service commits each Run Result in its own transaction, so a crash
  loses at most the impression in flight.

  Every backend:
  - hides writes until Commit()
  - discards them on Rollback() or when destroyed uncommitted

  SQLite opens with BEGIN IMMEDIATE; the memory backend copies its snapshot.
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace arena::db
