#include "internal/util/uuid.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace {

using valuegraph::util::UUID;

void TestGeneratedIdsAreVersion4AndDistinct() {
  std::set<UUID> seen;
  for (int i = 0; i < 256; ++i) {
    auto id = valuegraph::util::GenerateUUID();
    assert((id[6] & 0xF0) == 0x40);
    assert((id[8] & 0xC0) == 0x80);
    seen.insert(id);
  }
  assert(seen.size() == 256);
}

void TestStringFormParsesBack() {
  const std::string text = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";

  auto id = valuegraph::util::FromString(text);
  assert(id[0] == 0x6b);
  assert(id[15] == 0xc8);
  assert(valuegraph::util::ToString(id) == text);

  // dashes are optional, hex is case-insensitive
  assert(valuegraph::util::FromString("6BA7B8109DAD11D180B400C04FD430C8") == id);
}

void TestMalformedStringsAreRejected() {
  assert(!valuegraph::util::TryParse("").has_value());
  assert(!valuegraph::util::TryParse("alice").has_value());
  assert(!valuegraph::util::TryParse("6ba7b810-9dad-11d1-80b4-00c04fd430c").has_value());
  assert(!valuegraph::util::TryParse("6ba7b810-9dad-11d1-80b4-00c04fd430cz").has_value());

  bool threw = false;
  try {
    (void)valuegraph::util::FromString("not-a-uuid");
  } catch (const valuegraph::util::MalformedIdentifier&) {
    threw = true;
  }
  assert(threw);
}

void TestFromBytesRequiresSixteenBytes() {
  const unsigned char raw[17] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17};

  auto id = valuegraph::util::FromBytes(raw, 16);
  assert(id[0] == 1 && id[15] == 16);

  bool threw = false;
  try {
    (void)valuegraph::util::FromBytes(raw, 17);
  } catch (const valuegraph::util::MalformedIdentifier&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)valuegraph::util::FromBytes(raw, 15);
  } catch (const valuegraph::util::MalformedIdentifier&) {
    threw = true;
  }
  assert(threw);
}

void TestDerivedIdsAreStableVersion8() {
  auto a = valuegraph::util::DeriveUUID("alice");
  auto b = valuegraph::util::DeriveUUID("alice");
  auto c = valuegraph::util::DeriveUUID("bob");

  assert(a == b);
  assert(a != c);
  assert((a[6] & 0xF0) == 0x80);
  assert((a[8] & 0xC0) == 0x80);
  assert(valuegraph::util::DeriveUUID("") != valuegraph::util::DeriveUUID(std::string(1, '\0')));
}

void TestLegacyMapping() {
  const std::string canonical = "00000000-0000-0000-0000-000000000001";

  // UUID-shaped text keeps its bytes
  auto kept = valuegraph::util::LegacyUUID(canonical);
  assert(kept == valuegraph::util::FromString(canonical));
  assert(kept[15] == 1);
  assert(valuegraph::util::LegacyUUID("00000000000000000000000000000001") == kept);

  // anything else is name-derived
  assert(valuegraph::util::LegacyUUID("alice") == valuegraph::util::DeriveUUID("alice"));
  assert(valuegraph::util::LegacyUUID("alice") != valuegraph::util::LegacyUUID("Alice"));
}

void TestHashSpreadsIds() {
  std::unordered_set<UUID, valuegraph::util::UUIDHash> ids;
  for (int i = 0; i < 64; ++i) {
    ids.insert(valuegraph::util::DeriveUUID("node-" + std::to_string(i)));
  }
  assert(ids.size() == 64);
  assert(ids.contains(valuegraph::util::DeriveUUID("node-7")));
}

} // namespace

int main() {
  TestGeneratedIdsAreVersion4AndDistinct();
  TestStringFormParsesBack();
  TestMalformedStringsAreRejected();
  TestFromBytesRequiresSixteenBytes();
  TestDerivedIdsAreStableVersion8();
  TestLegacyMapping();
  TestHashSpreadsIds();

  std::cout << "valuegraph_unit_uuid: pass\n";
  return 0;
}
