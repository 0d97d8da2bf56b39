// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::Error -- error handling without exceptions.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + fixed-size message buffer + structured context
//     (statement, column/parameter index, attempt count, native code)
//   - Compatible with -fno-exceptions
//   - ErrorClass splits failures into retryable and terminal
//   - Native SQLite3 / MariaDB codes are mapped in the *_db.hpp headers

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace sqlbridge {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,
  kNotOpen = -2,
  kBusy = -3,
  kNotFound = -4,
  kConstraint = -5,
  kMismatch = -6,
  kMisuse = -7,
  kRange = -8,
  kNullParam = -9,
  kIoError = -10,
  kFull = -11,
  kCodec = -12,
  kMapping = -13,
  kParameterCount = -14,
  kPoolTimeout = -15,
  kAlreadyInTransaction = -16,
  kTransactionClosed = -17,
  kConnectionLost = -18,
  kLockTimeout = -19,
  kDeadlock = -20,
  kSyntax = -21,
  kShutdown = -22,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kError: return "error";
    case ErrorCode::kNotOpen: return "not_open";
    case ErrorCode::kBusy: return "busy";
    case ErrorCode::kNotFound: return "not_found";
    case ErrorCode::kConstraint: return "constraint";
    case ErrorCode::kMismatch: return "mismatch";
    case ErrorCode::kMisuse: return "misuse";
    case ErrorCode::kRange: return "range";
    case ErrorCode::kNullParam: return "null_param";
    case ErrorCode::kIoError: return "io_error";
    case ErrorCode::kFull: return "full";
    case ErrorCode::kCodec: return "codec";
    case ErrorCode::kMapping: return "mapping";
    case ErrorCode::kParameterCount: return "parameter_count";
    case ErrorCode::kPoolTimeout: return "pool_timeout";
    case ErrorCode::kAlreadyInTransaction: return "already_in_transaction";
    case ErrorCode::kTransactionClosed: return "transaction_closed";
    case ErrorCode::kConnectionLost: return "connection_lost";
    case ErrorCode::kLockTimeout: return "lock_timeout";
    case ErrorCode::kDeadlock: return "deadlock";
    case ErrorCode::kSyntax: return "syntax";
    case ErrorCode::kShutdown: return "shutdown";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// ErrorClass
// ---------------------------------------------------------------------------

enum class ErrorClass : uint8_t {
  kNone = 0,
  kRetryable,
  kTerminal,
};

/// Transient network and lock failures are retryable; everything else
/// (constraint, syntax, type, state misuse, ...) is terminal.
inline ErrorClass ClassifyCode(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return ErrorClass::kNone;
    case ErrorCode::kConnectionLost:
    case ErrorCode::kLockTimeout:
    case ErrorCode::kDeadlock:
    case ErrorCode::kBusy:
      return ErrorClass::kRetryable;
    default:
      return ErrorClass::kTerminal;
  }
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;
  static constexpr uint32_t kMaxStatementLen = 128;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};

  // Context, filled where known.
  char statement[kMaxStatementLen] = {};
  int32_t index = -1;        // column or parameter index
  int32_t attempts = 0;      // attempts made before surfacing
  int32_t native_code = 0;   // sqlite3 / mysql errno
  bool connection_fatal = false;  // the session must not be reused

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  ErrorClass Class() const { return ClassifyCode(code); }
  bool Retryable() const { return Class() == ErrorClass::kRetryable; }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  void SetStatement(const char* sql) {
    if (sql == nullptr) {
      statement[0] = '\0';
      return;
    }
    std::strncpy(statement, sql, kMaxStatementLen - 1);
    statement[kMaxStatementLen - 1] = '\0';
  }

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
    statement[0] = '\0';
    index = -1;
    attempts = 0;
    native_code = 0;
    connection_fatal = false;
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }
};

/// Copy `err` into `out` when the caller asked for it.
inline void Report(Error* out, const Error& err) {
  if (out != nullptr) { *out = err; }
}

}  // namespace sqlbridge
