// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge row mapper -- positional QueryResult row -> record conversion.
//
// Design:
//   - A record type opts in by specialising RowTraits<T> with a Fields()
//     function returning a tuple of member pointers in column order:
//
//       struct Emp { int64_t empno; std::string empname; };
//       template <> struct sqlbridge::RowTraits<Emp> {
//         static auto Fields() {
//           return std::make_tuple(&Emp::empno, &Emp::empname);
//         }
//       };
//
//   - Column i maps to field i; names are never consulted
//   - Arity or type mismatch -> kMapping naming the offending index
//   - All-or-nothing: a row maps completely or not at all, and MapRows()
//     fails the whole result if any row fails
//   - Integer fields are range-checked; narrowing that would lose data is a
//     mismatch, not a truncation

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "sqlbridge/error.hpp"
#include "sqlbridge/query_result.hpp"
#include "sqlbridge/value.hpp"

namespace sqlbridge {

template <typename T>
struct RowTraits;

// ---------------------------------------------------------------------------
// Field conversion
// ---------------------------------------------------------------------------

template <typename T>
typename std::enable_if<std::is_integral<T>::value &&
                            !std::is_same<T, bool>::value,
                        bool>::type
FromValue(const Value& v, T* out) {
  if (v.type() != ValueType::kInteger) { return false; }
  int64_t i = v.AsInteger();
  if (std::is_signed<T>::value) {
    if (i < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
        i > static_cast<int64_t>(std::numeric_limits<T>::max())) {
      return false;
    }
  } else {
    if (i < 0 || static_cast<uint64_t>(i) >
                     static_cast<uint64_t>(std::numeric_limits<T>::max())) {
      return false;
    }
  }
  *out = static_cast<T>(i);
  return true;
}

inline bool FromValue(const Value& v, bool* out) {
  if (v.type() != ValueType::kInteger) { return false; }
  *out = v.AsInteger() != 0;
  return true;
}

inline bool FromValue(const Value& v, double* out) {
  if (v.type() == ValueType::kFloat) {
    *out = v.AsFloat();
    return true;
  }
  if (v.type() == ValueType::kInteger) {
    // Only integers a double holds exactly.
    constexpr int64_t kExact = int64_t{1} << 53;
    int64_t i = v.AsInteger();
    if (i < -kExact || i > kExact) { return false; }
    *out = static_cast<double>(i);
    return true;
  }
  return false;
}

inline bool FromValue(const Value& v, std::string* out) {
  if (v.type() != ValueType::kText) { return false; }
  *out = v.AsText();
  return true;
}

inline bool FromValue(const Value& v, std::vector<uint8_t>* out) {
  if (v.type() != ValueType::kBlob) { return false; }
  *out = v.AsBlob();
  return true;
}

inline bool FromValue(const Value& v, Value* out) {
  *out = v;
  return true;
}

template <typename T>
bool FromValue(const Value& v, std::optional<T>* out) {
  if (v.IsNull()) {
    out->reset();
    return true;
  }
  T inner{};
  if (!FromValue(v, &inner)) { return false; }
  *out = std::move(inner);
  return true;
}

namespace detail {

template <typename F>
bool MapField(const Value& v, F* field, size_t col, Error* err) {
  if (FromValue(v, field)) { return true; }
  err->SetFormat(ErrorCode::kMapping,
                 "column %zu: %s value does not fit the record field", col,
                 ValueTypeName(v.type()));
  err->index = static_cast<int32_t>(col);
  return false;
}

template <typename T, typename Tuple, size_t... I>
Error MapFields(const Row& row, T* out, const Tuple& fields,
                std::index_sequence<I...>) {
  Error err;
  bool ok = (true && ... && MapField(row[I], &(out->*(std::get<I>(fields))),
                                     I, &err));
  (void)ok;
  return err;
}

template <typename T>
constexpr size_t FieldCount() {
  return std::tuple_size<decltype(RowTraits<T>::Fields())>::value;
}

inline Error ArityError(size_t columns, size_t fields) {
  Error err;
  err.SetFormat(ErrorCode::kMapping,
                "result has %zu columns, record has %zu fields", columns,
                fields);
  err.index = static_cast<int32_t>(columns < fields ? columns : fields);
  return err;
}

}  // namespace detail

// ---------------------------------------------------------------------------
// MapRow / MapRows
// ---------------------------------------------------------------------------

/// Map one row into *out. On failure *out is left untouched.
template <typename T>
Error MapRow(const Row& row, T* out) {
  constexpr size_t kFields = detail::FieldCount<T>();
  if (row.size() != kFields) {
    return detail::ArityError(row.size(), kFields);
  }
  T tmp{};
  Error err = detail::MapFields(row, &tmp, RowTraits<T>::Fields(),
                                std::make_index_sequence<kFields>{});
  if (!err.ok()) { return err; }
  *out = std::move(tmp);
  return Error::Ok();
}

/// Map every row of `result`. On any failure *out is left untouched.
template <typename T>
Error MapRows(const QueryResult& result, std::vector<T>* out) {
  constexpr size_t kFields = detail::FieldCount<T>();
  if (static_cast<size_t>(result.NumFields()) != kFields) {
    return detail::ArityError(static_cast<size_t>(result.NumFields()),
                              kFields);
  }
  std::vector<T> records;
  records.reserve(result.NumRows());
  uint32_t row_no = 0;
  for (const Row& row : result) {
    T rec{};
    Error err = MapRow(row, &rec);
    if (!err.ok()) {
      char detail_msg[Error::kMaxMessageLen];
      std::snprintf(detail_msg, sizeof(detail_msg), "row %u, %s", row_no,
                    err.message);
      err.Set(ErrorCode::kMapping, detail_msg);
      return err;
    }
    records.push_back(std::move(rec));
    ++row_no;
  }
  *out = std::move(records);
  return Error::Ok();
}

}  // namespace sqlbridge
