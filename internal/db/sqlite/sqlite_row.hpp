#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"

namespace fraudit::db::sqlite {

/*
  Binding and column helpers shared by the sqlite repository and dataset.
  Keeps sqlite3 types out of everything above this directory.
*/

inline void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

inline void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

inline void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

inline void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

template <typename T, typename BindFn>
void BindOptional(sqlite3_stmt* st, int idx, const std::optional<T>& value, BindFn bind) {
  if (value) {
    bind(st, idx, *value);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

inline std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

inline uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

inline int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

inline double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

inline bool IsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

inline std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColText(st, col);
}

inline std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColDouble(st, col);
}

inline std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColU64(st, col);
}

inline std::optional<bool> ColOptBool(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColI32(st, col) != 0;
}

inline Result Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

} // namespace fraudit::db::sqlite
