#include "internal/model/value.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

namespace {

using valuegraph::model::DebugString;
using valuegraph::model::TypeOf;
using valuegraph::model::Value;
using valuegraph::model::ValueType;

static_assert(valuegraph::model::ToString(ValueType::kF32) == "f32");
static_assert(std::variant_size_v<Value> == 13);

void TestTypeTagFollowsColumnOrder() {
  assert(TypeOf(Value{true}) == ValueType::kBool);
  assert(TypeOf(Value{std::uint8_t{1}}) == ValueType::kU8);
  assert(TypeOf(Value{std::int8_t{1}}) == ValueType::kI8);
  assert(TypeOf(Value{std::uint16_t{1}}) == ValueType::kU16);
  assert(TypeOf(Value{std::int16_t{1}}) == ValueType::kI16);
  assert(TypeOf(Value{std::uint32_t{1}}) == ValueType::kU32);
  assert(TypeOf(Value{std::int32_t{1}}) == ValueType::kI32);
  assert(TypeOf(Value{std::uint64_t{1}}) == ValueType::kU64);
  assert(TypeOf(Value{std::int64_t{1}}) == ValueType::kI64);
  assert(TypeOf(Value{1.0f}) == ValueType::kF32);
  assert(TypeOf(Value{1.0}) == ValueType::kF64);
  assert(TypeOf(Value{std::string("x")}) == ValueType::kStr);
}

void TestColumnNames() {
  assert(valuegraph::model::ToString(ValueType::kNone) == "none");
  assert(valuegraph::model::ToString(ValueType::kBool) == "bool");
  assert(valuegraph::model::ToString(ValueType::kU64) == "u64");
  assert(valuegraph::model::ToString(ValueType::kStr) == "str");
}

void TestDebugString() {
  assert(DebugString(Value{}) == "none");
  assert(DebugString(Value{std::uint32_t{42}}) == "u32:42");
  assert(DebugString(Value{std::uint8_t{255}}) == "u8:255");
  assert(DebugString(Value{std::int8_t{-3}}) == "i8:-3");
  assert(DebugString(Value{false}) == "bool:false");
  assert(DebugString(Value{std::string("likes")}) == "str:\"likes\"");
}

void TestOnlyOnePayloadIsActive() {
  Value value = std::uint32_t{42};
  value       = std::string("replaced");
  assert(TypeOf(value) == ValueType::kStr);
  assert(!std::holds_alternative<std::uint32_t>(value));
}

} // namespace

int main() {
  TestTypeTagFollowsColumnOrder();
  TestColumnNames();
  TestDebugString();
  TestOnlyOnePayloadIsActive();

  std::cout << "valuegraph_unit_value: pass\n";
  return 0;
}
