#include "sqlite_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"

namespace fraudit::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_lock_(db_->WriterMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  std::string error;
  if (db_->TryExec("ROLLBACK;", &error) != SQLITE_OK) {
    FRAUDIT_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", error)});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  writer_lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  db_->Exec("ROLLBACK;");
  writer_lock_.unlock();
}

} // namespace fraudit::db::sqlite
