// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge::Value -- backend-neutral cell / parameter value.
//
// Design:
//   - Tagged union over Null, Integer(int64), Float(double), Text, Blob
//   - Text holds UTF-8 bytes, Blob holds raw bytes
//   - Integers are always 64-bit; narrower backend widths are widened
//     by the codecs, never truncated
//   - Copyable value type, used both for bind parameters and decoded cells

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace sqlbridge {

// ---------------------------------------------------------------------------
// ValueType
// ---------------------------------------------------------------------------

enum class ValueType : uint8_t {
  kNull = 0,
  kInteger,
  kFloat,
  kText,
  kBlob,
};

inline const char* ValueTypeName(ValueType type) {
  switch (type) {
    case ValueType::kNull: return "null";
    case ValueType::kInteger: return "integer";
    case ValueType::kFloat: return "float";
    case ValueType::kText: return "text";
    case ValueType::kBlob: return "blob";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

class Value {
 public:
  Value() = default;

  static Value Null() { return Value{}; }

  static Value Integer(int64_t v) {
    Value out;
    out.type_ = ValueType::kInteger;
    out.int_ = v;
    return out;
  }

  static Value Float(double v) {
    Value out;
    out.type_ = ValueType::kFloat;
    out.float_ = v;
    return out;
  }

  static Value Text(std::string v) {
    Value out;
    out.type_ = ValueType::kText;
    out.bytes_.assign(v.begin(), v.end());
    return out;
  }

  static Value Text(const char* data, size_t len) {
    Value out;
    out.type_ = ValueType::kText;
    if (data != nullptr) { out.bytes_.assign(data, data + len); }
    return out;
  }

  static Value Blob(std::vector<uint8_t> v) {
    Value out;
    out.type_ = ValueType::kBlob;
    out.bytes_.assign(v.begin(), v.end());
    return out;
  }

  static Value Blob(const uint8_t* data, size_t len) {
    Value out;
    out.type_ = ValueType::kBlob;
    if (data != nullptr) { out.bytes_.assign(data, data + len); }
    return out;
  }

  ValueType type() const { return type_; }
  bool IsNull() const { return type_ == ValueType::kNull; }

  // --- Accessors (return a neutral value for the wrong variant) ---

  int64_t AsInteger() const {
    return type_ == ValueType::kInteger ? int_ : 0;
  }

  double AsFloat() const {
    return type_ == ValueType::kFloat ? float_ : 0.0;
  }

  std::string AsText() const {
    if (type_ != ValueType::kText) { return std::string(); }
    return std::string(bytes_.begin(), bytes_.end());
  }

  std::vector<uint8_t> AsBlob() const {
    if (type_ != ValueType::kBlob) { return std::vector<uint8_t>(); }
    return std::vector<uint8_t>(bytes_.begin(), bytes_.end());
  }

  /// Raw bytes of a Text or Blob value (empty for other variants).
  const char* Data() const { return bytes_.data(); }
  size_t Size() const {
    return (type_ == ValueType::kText || type_ == ValueType::kBlob)
               ? bytes_.size() : 0;
  }

  bool operator==(const Value& other) const {
    if (type_ != other.type_) { return false; }
    switch (type_) {
      case ValueType::kNull: return true;
      case ValueType::kInteger: return int_ == other.int_;
      case ValueType::kFloat: return float_ == other.float_;
      case ValueType::kText:
      case ValueType::kBlob: return bytes_ == other.bytes_;
    }
    return false;
  }

  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  ValueType type_ = ValueType::kNull;
  int64_t int_ = 0;
  double float_ = 0.0;
  std::vector<char> bytes_;
};

using Params = std::vector<Value>;

// ---------------------------------------------------------------------------
// UTF-8 validation (used by the codecs on text cells)
// ---------------------------------------------------------------------------

/// Returns true if [data, data+len) is well-formed UTF-8 (no overlongs,
/// no surrogates, nothing above U+10FFFF).
inline bool IsValidUtf8(const char* data, size_t len) {
  const auto* s = reinterpret_cast<const uint8_t*>(data);
  size_t i = 0;
  while (i < len) {
    uint8_t c = s[i];
    if (c < 0x80) {
      ++i;
      continue;
    }
    size_t n = 0;
    uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
      n = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      n = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      n = 3;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + n >= len) { return false; }
    for (size_t k = 1; k <= n; ++k) {
      uint8_t cc = s[i + k];
      if ((cc & 0xC0) != 0x80) { return false; }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if ((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) ||
        (n == 3 && cp < 0x10000)) {
      return false;
    }
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) { return false; }
    i += n + 1;
  }
  return true;
}

}  // namespace sqlbridge
