// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge SQLite3 codec -- Value <-> sqlite3 bind/column conversion,
// and sqlite3 result codes -> sqlbridge error codes.
//
// Design:
//   - Encode binds each Value variant with the matching sqlite3_bind_*
//   - Decode goes by storage class (sqlite3_column_type), so every cell maps
//     to exactly one Value variant without loss
//   - Text cells are validated as UTF-8; bad text is a kCodec error that
//     names the column
//   - Declared column types only produce a type hint for the schema

#pragma once

#include <cstdint>
#include <cstring>

#include "sqlite3.h"

#include "sqlbridge/error.hpp"
#include "sqlbridge/value.hpp"

namespace sqlbridge {

// ---------------------------------------------------------------------------
// Error codes
// ---------------------------------------------------------------------------

inline ErrorCode MapSqlite3Code(int32_t rc) {
  switch (rc & 0xFF) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:
      return ErrorCode::kOk;
    case SQLITE_BUSY: return ErrorCode::kBusy;
    case SQLITE_LOCKED: return ErrorCode::kLockTimeout;
    case SQLITE_CONSTRAINT: return ErrorCode::kConstraint;
    case SQLITE_MISMATCH: return ErrorCode::kMismatch;
    case SQLITE_RANGE: return ErrorCode::kRange;
    case SQLITE_MISUSE: return ErrorCode::kMisuse;
    case SQLITE_FULL: return ErrorCode::kFull;
    case SQLITE_NOTFOUND: return ErrorCode::kNotFound;
    case SQLITE_IOERR:
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
    case SQLITE_CANTOPEN:
      return ErrorCode::kIoError;
    default:
      return ErrorCode::kError;
  }
}

/// I/O and corruption failures leave the handle unusable.
inline bool IsSqlite3ConnectionFatal(int32_t rc) {
  switch (rc & 0xFF) {
    case SQLITE_IOERR:
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
    case SQLITE_CANTOPEN:
      return true;
    default:
      return false;
  }
}

inline void SetSqlite3Error(Error* out, sqlite3* db, int32_t rc,
                            const char* sql = nullptr) {
  if (out == nullptr) { return; }
  ErrorCode code = MapSqlite3Code(rc);
  if (code == ErrorCode::kOk) { code = ErrorCode::kError; }
  out->Set(code, db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
  out->native_code = rc;
  out->connection_fatal = IsSqlite3ConnectionFatal(rc);
  if (sql != nullptr) { out->SetStatement(sql); }
}

// ---------------------------------------------------------------------------
// Encode
// ---------------------------------------------------------------------------

/// Bind `value` to the 1-based parameter `param`.
inline Error Sqlite3BindValue(sqlite3_stmt* stmt, int32_t param,
                              const Value& value) {
  if (stmt == nullptr) {
    return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
  }
  int32_t rc = SQLITE_OK;
  switch (value.type()) {
    case ValueType::kNull:
      rc = sqlite3_bind_null(stmt, param);
      break;
    case ValueType::kInteger:
      rc = sqlite3_bind_int64(stmt, param,
                              static_cast<sqlite3_int64>(value.AsInteger()));
      break;
    case ValueType::kFloat:
      rc = sqlite3_bind_double(stmt, param, value.AsFloat());
      break;
    case ValueType::kText:
      // Empty text must not bind as NULL either.
      rc = sqlite3_bind_text64(stmt, param,
                               value.Size() == 0 ? "" : value.Data(),
                               static_cast<sqlite3_uint64>(value.Size()),
                               SQLITE_TRANSIENT, SQLITE_UTF8);
      break;
    case ValueType::kBlob:
      // A zero-length blob must not bind as NULL.
      if (value.Size() == 0) {
        rc = sqlite3_bind_zeroblob(stmt, param, 0);
      } else {
        rc = sqlite3_bind_blob64(stmt, param, value.Data(),
                                 static_cast<sqlite3_uint64>(value.Size()),
                                 SQLITE_TRANSIENT);
      }
      break;
  }
  if (rc != SQLITE_OK) {
    Error err;
    err.SetFormat(MapSqlite3Code(rc), "bind %s to parameter %d failed: %s",
                  ValueTypeName(value.type()), param, sqlite3_errstr(rc));
    err.index = param;
    err.native_code = rc;
    return err;
  }
  return Error::Ok();
}

// ---------------------------------------------------------------------------
// Decode
// ---------------------------------------------------------------------------

/// Type hint from a declared column type, following SQLite's affinity rules.
inline ValueType Sqlite3HintFromDeclType(const char* decl) {
  if (decl == nullptr) { return ValueType::kNull; }
  auto contains = [decl](const char* needle) {
    size_t n = std::strlen(needle);
    for (const char* p = decl; *p != '\0'; ++p) {
      if (sqlite3_strnicmp(p, needle, static_cast<int>(n)) == 0) {
        return true;
      }
    }
    return false;
  };
  if (contains("INT")) { return ValueType::kInteger; }
  if (contains("CHAR") || contains("CLOB") || contains("TEXT")) {
    return ValueType::kText;
  }
  if (decl[0] == '\0' || contains("BLOB")) { return ValueType::kBlob; }
  if (contains("REAL") || contains("FLOA") || contains("DOUB")) {
    return ValueType::kFloat;
  }
  return ValueType::kNull;
}

/// Decode column `col` of the current row. On malformed text, sets a
/// kCodec error naming the column and returns Null.
inline Value Sqlite3DecodeColumn(sqlite3_stmt* stmt, int32_t col,
                                 Error* out_error) {
  switch (sqlite3_column_type(stmt, col)) {
    case SQLITE_INTEGER:
      return Value::Integer(
          static_cast<int64_t>(sqlite3_column_int64(stmt, col)));
    case SQLITE_FLOAT:
      return Value::Float(sqlite3_column_double(stmt, col));
    case SQLITE_TEXT: {
      const auto* text =
          reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
      size_t len = static_cast<size_t>(sqlite3_column_bytes(stmt, col));
      if (!IsValidUtf8(text, len)) {
        if (out_error != nullptr) {
          out_error->SetFormat(ErrorCode::kCodec,
                               "column %d: text is not valid UTF-8", col);
          out_error->index = col;
        }
        return Value::Null();
      }
      return Value::Text(text, len);
    }
    case SQLITE_BLOB: {
      const auto* blob =
          static_cast<const uint8_t*>(sqlite3_column_blob(stmt, col));
      size_t len = static_cast<size_t>(sqlite3_column_bytes(stmt, col));
      return Value::Blob(blob, len);
    }
    case SQLITE_NULL:
    default:
      return Value::Null();
  }
}

}  // namespace sqlbridge
