#pragma once

#include "sqlite_db.hpp"

namespace fraudit::db::sqlite {

// Creates every table and index if missing, then checks that each table is readable.
void BootstrapSchema(SqliteDB& db);

} // namespace fraudit::db::sqlite
