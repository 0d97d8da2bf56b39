// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge placeholder scanning -- counts positional '?' markers.
//
// Used to reject statement/parameter arity mismatches before any
// connection is leased. Both backends use anonymous '?' placeholders.
// Markers inside string literals, quoted identifiers and comments are
// ignored. MariaDB treats backslash as an escape inside literals, SQLite
// does not.

#pragma once

#include <cstddef>
#include <cstdint>

#include "sqlbridge/error.hpp"

namespace sqlbridge {

inline int32_t CountPlaceholders(const char* sql, bool backslash_escapes) {
  if (sql == nullptr) { return 0; }
  int32_t count = 0;
  const char* p = sql;
  while (*p != '\0') {
    char c = *p;
    if (c == '\'' || c == '"' || c == '`') {
      char quote = c;
      ++p;
      while (*p != '\0' && *p != quote) {
        if (backslash_escapes && *p == '\\' && p[1] != '\0') { ++p; }
        ++p;
      }
      if (*p == quote) { ++p; }
      continue;
    }
    if (c == '-' && p[1] == '-') {
      while (*p != '\0' && *p != '\n') { ++p; }
      continue;
    }
    if (c == '#' && backslash_escapes) {
      // MySQL line comment
      while (*p != '\0' && *p != '\n') { ++p; }
      continue;
    }
    if (c == '/' && p[1] == '*') {
      p += 2;
      while (*p != '\0' && !(*p == '*' && p[1] == '/')) { ++p; }
      if (*p != '\0') { p += 2; }
      continue;
    }
    if (c == '?') { ++count; }
    ++p;
  }
  return count;
}

/// kParameterCount if the statement's placeholder count differs from
/// `num_params`.
inline Error CheckParameterCount(const char* sql, size_t num_params,
                                 bool backslash_escapes) {
  if (sql == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "sql is null");
  }
  int32_t expected = CountPlaceholders(sql, backslash_escapes);
  if (static_cast<size_t>(expected) != num_params) {
    Error err;
    err.SetFormat(ErrorCode::kParameterCount,
                  "statement has %d placeholders, %zu parameters given",
                  expected, num_params);
    err.SetStatement(sql);
    err.index = expected;
    return err;
  }
  return Error::Ok();
}

}  // namespace sqlbridge
