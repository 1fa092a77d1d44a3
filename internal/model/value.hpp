#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace valuegraph::model {

/*
  Typed scalar payload of a Value Record.

  Alternative order matches the persisted column order
  (bool, u8, i8, u16, i16, u32, i32, u64, i64, f32, f64, str).
  std::monostate is a record with no payload.
*/
using Value = std::variant<std::monostate,
                           bool,
                           std::uint8_t,
                           std::int8_t,
                           std::uint16_t,
                           std::int16_t,
                           std::uint32_t,
                           std::int32_t,
                           std::uint64_t,
                           std::int64_t,
                           float,
                           double,
                           std::string>;

enum class ValueType : std::uint8_t {
  kNone = 0,
  kBool,
  kU8,
  kI8,
  kU16,
  kI16,
  kU32,
  kI32,
  kU64,
  kI64,
  kF32,
  kF64,
  kStr,
};

constexpr ValueType TypeOf(const Value& value) {
  return static_cast<ValueType>(value.index());
}

// Column name in the values table; "none" for kNone.
constexpr std::string_view ToString(ValueType type) {
  switch (type) {
    case ValueType::kBool:
      return "bool";
    case ValueType::kU8:
      return "u8";
    case ValueType::kI8:
      return "i8";
    case ValueType::kU16:
      return "u16";
    case ValueType::kI16:
      return "i16";
    case ValueType::kU32:
      return "u32";
    case ValueType::kI32:
      return "i32";
    case ValueType::kU64:
      return "u64";
    case ValueType::kI64:
      return "i64";
    case ValueType::kF32:
      return "f32";
    case ValueType::kF64:
      return "f64";
    case ValueType::kStr:
      return "str";
    case ValueType::kNone:
    default:
      return "none";
  }
}

// Human readable "type:value", used in logs and tool output.
std::string DebugString(const Value& value);

} // namespace valuegraph::model
