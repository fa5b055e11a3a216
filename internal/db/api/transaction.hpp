#pragma once

namespace fraudit::db {

/*
  Unit of work over relationship and alert rows.

  - Writes become visible to other transactions only after Commit()
  - Reads through the same transaction see its own writes
  - A transaction destroyed without Commit() rolls back
  - Writers are serialized: Begin() blocks while another transaction is open
  - Read transactions (BeginRead) never observe uncommitted writes

  SQLite takes BEGIN IMMEDIATE under the connection's writer mutex for both
  kinds. The memory backend writes in place under an exclusive lock with an
  undo log, and lets read transactions share the lock.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace fraudit::db
