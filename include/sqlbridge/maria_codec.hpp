// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge MariaDB codec -- Value <-> MYSQL_BIND conversion, and client /
// server errno -> sqlbridge error codes.
//
// Design:
//   - Parameters: one MYSQL_BIND per Value; integer and double payloads live
//     in MariaParamBuffer, text/blob point into the caller's Values
//   - Results: integer columns are fetched as LONGLONG (widened by the
//     client library), FLOAT/DOUBLE as DOUBLE, everything else as bytes
//   - Byte columns decode to Blob when the column charset is binary (63),
//     otherwise to Text after UTF-8 validation
//   - Unsigned BIGINT values above INT64_MAX are a kCodec error, never
//     wrapped

#pragma once

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

#include <mysql.h>

#include "sqlbridge/error.hpp"
#include "sqlbridge/query_result.hpp"
#include "sqlbridge/value.hpp"

namespace sqlbridge {

// ---------------------------------------------------------------------------
// Error codes
// ---------------------------------------------------------------------------

inline bool IsMariaConnectionFatal(uint32_t errnum) {
  switch (errnum) {
    case 2002:  // CR_CONNECTION_ERROR
    case 2003:  // CR_CONN_HOST_ERROR
    case 2006:  // CR_SERVER_GONE_ERROR
    case 2013:  // CR_SERVER_LOST
    case 2055:  // CR_SERVER_LOST_EXTENDED
      return true;
    default:
      return false;
  }
}

inline ErrorCode MapMariaCode(uint32_t errnum) {
  if (errnum == 0) { return ErrorCode::kOk; }
  if (IsMariaConnectionFatal(errnum)) { return ErrorCode::kConnectionLost; }
  switch (errnum) {
    case 1205: return ErrorCode::kLockTimeout;  // ER_LOCK_WAIT_TIMEOUT
    case 1213: return ErrorCode::kDeadlock;     // ER_LOCK_DEADLOCK
    case 1048:  // ER_BAD_NULL_ERROR
    case 1062:  // ER_DUP_ENTRY
    case 1216:  // ER_NO_REFERENCED_ROW
    case 1217:  // ER_ROW_IS_REFERENCED
    case 1451:  // ER_ROW_IS_REFERENCED_2
    case 1452:  // ER_NO_REFERENCED_ROW_2
    case 3819:  // ER_CHECK_CONSTRAINT_VIOLATED
      return ErrorCode::kConstraint;
    case 1064:  // ER_PARSE_ERROR
    case 1149:  // ER_SYNTAX_ERROR
      return ErrorCode::kSyntax;
    case 1054:  // ER_BAD_FIELD_ERROR
    case 1146:  // ER_NO_SUCH_TABLE
      return ErrorCode::kNotFound;
    case 1264:  // ER_WARN_DATA_OUT_OF_RANGE
    case 1265:  // WARN_DATA_TRUNCATED
    case 1292:  // ER_TRUNCATED_WRONG_VALUE
    case 1366:  // ER_TRUNCATED_WRONG_VALUE_FOR_FIELD
      return ErrorCode::kMismatch;
    case 2014:  // CR_COMMANDS_OUT_OF_SYNC
      return ErrorCode::kMisuse;
    default:
      return ErrorCode::kError;
  }
}

inline void SetMariaError(Error* out, uint32_t errnum, const char* msg,
                          const char* sql = nullptr) {
  if (out == nullptr) { return; }
  ErrorCode code = MapMariaCode(errnum);
  if (code == ErrorCode::kOk) { code = ErrorCode::kError; }
  out->Set(code, msg);
  out->native_code = static_cast<int32_t>(errnum);
  out->connection_fatal = IsMariaConnectionFatal(errnum);
  if (sql != nullptr) { out->SetStatement(sql); }
}

// ---------------------------------------------------------------------------
// Encode
// ---------------------------------------------------------------------------

/// Bind buffers for one execution. Must outlive mysql_stmt_execute(), and
/// so must the Values it was built from.
struct MariaParamBuffer {
  std::vector<MYSQL_BIND> binds;
  std::vector<int64_t> ints;
  std::vector<double> doubles;
  std::vector<unsigned long> lengths;
};

inline void MariaEncodeParams(const Params& params, MariaParamBuffer* out) {
  size_t n = params.size();
  out->binds.assign(n, MYSQL_BIND{});
  out->ints.assign(n, 0);
  out->doubles.assign(n, 0.0);
  out->lengths.assign(n, 0);
  static char kEmpty[1] = {'\0'};

  for (size_t i = 0; i < n; ++i) {
    const Value& v = params[i];
    MYSQL_BIND& b = out->binds[i];
    std::memset(&b, 0, sizeof(MYSQL_BIND));
    switch (v.type()) {
      case ValueType::kNull:
        b.buffer_type = MYSQL_TYPE_NULL;
        break;
      case ValueType::kInteger:
        out->ints[i] = v.AsInteger();
        b.buffer_type = MYSQL_TYPE_LONGLONG;
        b.buffer = &out->ints[i];
        b.is_unsigned = 0;
        break;
      case ValueType::kFloat:
        out->doubles[i] = v.AsFloat();
        b.buffer_type = MYSQL_TYPE_DOUBLE;
        b.buffer = &out->doubles[i];
        break;
      case ValueType::kText:
      case ValueType::kBlob:
        out->lengths[i] = static_cast<unsigned long>(v.Size());
        b.buffer_type = v.type() == ValueType::kText ? MYSQL_TYPE_STRING
                                                     : MYSQL_TYPE_BLOB;
        b.buffer = v.Size() == 0 ? kEmpty : const_cast<char*>(v.Data());
        b.buffer_length = out->lengths[i];
        b.length = &out->lengths[i];
        break;
    }
  }
}

// ---------------------------------------------------------------------------
// Decode
// ---------------------------------------------------------------------------

constexpr uint32_t kMariaBinaryCharset = 63;

inline bool IsMariaIntegerType(enum_field_types type) {
  switch (type) {
    case MYSQL_TYPE_TINY:
    case MYSQL_TYPE_SHORT:
    case MYSQL_TYPE_INT24:
    case MYSQL_TYPE_LONG:
    case MYSQL_TYPE_LONGLONG:
    case MYSQL_TYPE_YEAR:
      return true;
    default:
      return false;
  }
}

inline ValueType MariaHintFromField(const MYSQL_FIELD& field) {
  if (IsMariaIntegerType(field.type) || field.type == MYSQL_TYPE_BIT) {
    return ValueType::kInteger;
  }
  switch (field.type) {
    case MYSQL_TYPE_FLOAT:
    case MYSQL_TYPE_DOUBLE:
      return ValueType::kFloat;
    case MYSQL_TYPE_NULL:
      return ValueType::kNull;
    case MYSQL_TYPE_TINY_BLOB:
    case MYSQL_TYPE_MEDIUM_BLOB:
    case MYSQL_TYPE_LONG_BLOB:
    case MYSQL_TYPE_BLOB:
    case MYSQL_TYPE_STRING:
    case MYSQL_TYPE_VAR_STRING:
    case MYSQL_TYPE_VARCHAR:
    case MYSQL_TYPE_GEOMETRY:
      return field.charsetnr == kMariaBinaryCharset ? ValueType::kBlob
                                                    : ValueType::kText;
    default:
      // DECIMAL, temporal, ENUM, SET, JSON: textual form is lossless
      return ValueType::kText;
  }
}

/// Result-side bind storage for one row.
struct MariaResultBuffer {
  static constexpr unsigned long kInitialBytes = 256;

  std::vector<MYSQL_BIND> binds;
  std::vector<ValueType> hints;
  std::vector<int64_t> ints;
  std::vector<double> doubles;
  std::vector<std::vector<char>> bytes;
  std::vector<unsigned long> lengths;
  std::vector<my_bool> nulls;
  std::vector<my_bool> errors;
  std::vector<my_bool> unsigned_flags;
};

inline void MariaPrepareResult(const MYSQL_FIELD* fields, uint32_t n,
                               MariaResultBuffer* out,
                               std::vector<Column>* columns) {
  out->binds.assign(n, MYSQL_BIND{});
  out->hints.assign(n, ValueType::kNull);
  out->ints.assign(n, 0);
  out->doubles.assign(n, 0.0);
  out->bytes.assign(n, std::vector<char>());
  out->lengths.assign(n, 0);
  out->nulls.assign(n, 0);
  out->errors.assign(n, 0);
  out->unsigned_flags.assign(n, 0);
  columns->clear();

  for (uint32_t i = 0; i < n; ++i) {
    const MYSQL_FIELD& f = fields[i];
    MYSQL_BIND& b = out->binds[i];
    std::memset(&b, 0, sizeof(MYSQL_BIND));
    b.is_null = &out->nulls[i];
    b.error = &out->errors[i];
    b.length = &out->lengths[i];

    ValueType hint = MariaHintFromField(f);
    out->hints[i] = hint;
    if (IsMariaIntegerType(f.type)) {
      out->unsigned_flags[i] = (f.flags & UNSIGNED_FLAG) != 0 ? 1 : 0;
      b.buffer_type = MYSQL_TYPE_LONGLONG;
      b.buffer = &out->ints[i];
      b.is_unsigned = out->unsigned_flags[i];
    } else if (f.type == MYSQL_TYPE_FLOAT || f.type == MYSQL_TYPE_DOUBLE) {
      b.buffer_type = MYSQL_TYPE_DOUBLE;
      b.buffer = &out->doubles[i];
    } else {
      out->bytes[i].resize(MariaResultBuffer::kInitialBytes);
      b.buffer_type = (hint == ValueType::kBlob || f.type == MYSQL_TYPE_BIT)
                          ? MYSQL_TYPE_BLOB : MYSQL_TYPE_STRING;
      b.buffer = out->bytes[i].data();
      b.buffer_length = MariaResultBuffer::kInitialBytes;
    }

    Column c;
    c.name = (f.name != nullptr) ? f.name : "";
    c.type_hint = hint;
    columns->push_back(std::move(c));
  }
}

/// Decode column `col` of the fetched row. Sets a kCodec error naming the
/// column on malformed data.
inline Value MariaDecodeColumn(const MYSQL_FIELD& field,
                               const MariaResultBuffer& buf, uint32_t col,
                               Error* out_error) {
  if (buf.nulls[col] != 0) { return Value::Null(); }

  if (IsMariaIntegerType(field.type)) {
    if (buf.unsigned_flags[col] != 0) {
      uint64_t u = static_cast<uint64_t>(buf.ints[col]);
      if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        if (out_error != nullptr) {
          out_error->SetFormat(ErrorCode::kCodec,
                               "column %u: unsigned value %llu exceeds int64",
                               col, static_cast<unsigned long long>(u));
          out_error->index = static_cast<int32_t>(col);
        }
        return Value::Null();
      }
    }
    return Value::Integer(buf.ints[col]);
  }
  if (field.type == MYSQL_TYPE_FLOAT || field.type == MYSQL_TYPE_DOUBLE) {
    return Value::Float(buf.doubles[col]);
  }

  const char* data = buf.bytes[col].data();
  size_t len = static_cast<size_t>(buf.lengths[col]);
  if (field.type == MYSQL_TYPE_BIT) {
    // Big-endian bit string, at most 64 bits.
    uint64_t bits = 0;
    for (size_t k = 0; k < len; ++k) {
      bits = (bits << 8) | static_cast<uint8_t>(data[k]);
    }
    return Value::Integer(static_cast<int64_t>(bits));
  }
  if (buf.hints[col] == ValueType::kBlob) {
    return Value::Blob(reinterpret_cast<const uint8_t*>(data), len);
  }
  if (!IsValidUtf8(data, len)) {
    if (out_error != nullptr) {
      out_error->SetFormat(ErrorCode::kCodec,
                           "column %u: text is not valid UTF-8", col);
      out_error->index = static_cast<int32_t>(col);
    }
    return Value::Null();
  }
  return Value::Text(data, len);
}

}  // namespace sqlbridge
