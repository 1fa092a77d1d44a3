#include "uuid.hpp"

#include <cstring>
#include <iomanip>
#include <random>
#include <sstream>

#include "errors.hpp"

namespace valuegraph::util {

namespace {

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime       = 1099511628211ULL;

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

uint64_t Fnv1a64(std::string_view data, uint64_t basis) {
  uint64_t hash = basis;
  for (char c : data) {
    hash ^= static_cast<uint8_t>(c);
    hash *= kFnvPrime;
  }
  return hash;
}

void StoreBigEndian(uint64_t v, uint8_t* out) {
  for (int i = 7; i >= 0; --i) {
    out[i] = static_cast<uint8_t>(v & 0xFF);
    v >>= 8;
  }
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

std::optional<UUID> TryParse(std::string_view str) {
  std::string hex;
  hex.reserve(32);

  for (char c : str) {
    if (c == '-') continue;
    if (HexNibble(c) < 0) return std::nullopt;
    hex.push_back(c);
  }

  if (hex.size() != 32) return std::nullopt;

  UUID id{};
  for (size_t i = 0; i < 16; ++i)
    id[i] = static_cast<uint8_t>((HexNibble(hex[2 * i]) << 4) | HexNibble(hex[2 * i + 1]));

  return id;
}

UUID FromString(std::string_view str) {
  auto id = TryParse(str);
  if (!id) throw MalformedIdentifier("invalid uuid string: '" + std::string(str) + "'");
  return *id;
}

UUID FromBytes(const void* data, std::size_t size) {
  if (size != 16 || data == nullptr)
    throw MalformedIdentifier("invalid uuid: expected 16 bytes, got " + std::to_string(size));

  UUID id{};
  std::memcpy(id.data(), data, 16);
  return id;
}

UUID DeriveUUID(std::string_view name) {
  const uint64_t hi = Fnv1a64(name, kFnvOffsetBasis);
  const uint64_t lo = Fnv1a64(name, hi ^ kFnvOffsetBasis);

  UUID id{};
  StoreBigEndian(hi, id.data());
  StoreBigEndian(lo, id.data() + 8);

  // RFC9562 variant + version 8 (custom)
  id[6] = (id[6] & 0x0F) | 0x80;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

UUID LegacyUUID(std::string_view text) {
  if (auto parsed = TryParse(text)) return *parsed;
  return DeriveUUID(text);
}

std::size_t UUIDHash::operator()(const UUID& id) const noexcept {
  uint64_t a = 0;
  uint64_t b = 0;
  std::memcpy(&a, id.data(), 8);
  std::memcpy(&b, id.data() + 8, 8);
  return std::hash<uint64_t>{}(a ^ (b * kFnvPrime));
}

} // namespace valuegraph::util
