// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::QueryResult -- fully materialised, backend-neutral result.
//
// Design:
//   - Column schema (name + type hint) and rows of Values
//   - Every row has exactly NumFields() cells; AddRow() rejects others
//   - Random access like the old result-set wrappers, but owns its data
//     so it outlives the connection that produced it

#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "sqlbridge/error.hpp"
#include "sqlbridge/value.hpp"

namespace sqlbridge {

struct Column {
  std::string name;
  ValueType type_hint = ValueType::kNull;  // kNull: backend gave no hint
  std::string decl_type;
};

using Row = std::vector<Value>;

/// Outcome of a statement without a result set.
struct ExecResult {
  int64_t affected_rows = 0;
  int64_t last_insert_id = 0;
};

// ---------------------------------------------------------------------------
// QueryResult
// ---------------------------------------------------------------------------

class QueryResult {
 public:
  QueryResult() = default;

  explicit QueryResult(std::vector<Column> columns)
      : columns_(std::move(columns)) {}

  // --- Field info ---

  int32_t NumFields() const { return static_cast<int32_t>(columns_.size()); }
  uint32_t NumRows() const { return static_cast<uint32_t>(rows_.size()); }
  bool Empty() const { return rows_.empty(); }

  const std::vector<Column>& Columns() const { return columns_; }

  int32_t FieldIndex(const char* name) const {
    if (name == nullptr) { return -1; }
    for (size_t i = 0; i < columns_.size(); ++i) {
      if (columns_[i].name == name) { return static_cast<int32_t>(i); }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    if (col < 0 || col >= NumFields()) { return nullptr; }
    return columns_[static_cast<size_t>(col)].name.c_str();
  }

  // --- Rows ---

  /// Append a row. Fails with kMismatch if its arity differs from the
  /// column count.
  Error AddRow(Row row) {
    if (row.size() != columns_.size()) {
      Error err;
      err.SetFormat(ErrorCode::kMismatch,
                    "row has %zu cells, result has %zu columns",
                    row.size(), columns_.size());
      err.index = static_cast<int32_t>(row.size());
      return err;
    }
    rows_.push_back(std::move(row));
    return Error::Ok();
  }

  const Row& GetRow(uint32_t row) const { return rows_.at(row); }

  /// Cell accessor; out-of-range coordinates yield a Null value.
  const Value& At(uint32_t row, int32_t col) const {
    static const Value kNullValue;
    if (row >= rows_.size() || col < 0 || col >= NumFields()) {
      return kNullValue;
    }
    return rows_[row][static_cast<size_t>(col)];
  }

  std::vector<Row>::const_iterator begin() const { return rows_.begin(); }
  std::vector<Row>::const_iterator end() const { return rows_.end(); }

  void Clear() {
    columns_.clear();
    rows_.clear();
  }

 private:
  std::vector<Column> columns_;
  std::vector<Row> rows_;
};

}  // namespace sqlbridge
