#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace valuegraph::util {

/*
  UUID helpers

  Generation-2 identifiers are raw 16 byte UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Accepts 32 hex digits, dashes anywhere. Throws MalformedIdentifier.
UUID                FromString(std::string_view str);
std::optional<UUID> TryParse(std::string_view str);

// Raw bytes as stored in a BLOB column. Throws MalformedIdentifier unless size == 16.
UUID FromBytes(const void* data, std::size_t size);

/*
  Name-derived UUID (RFC 9562 version 8).

  Two FNV-1a 64 lanes over the name; the second lane is seeded with the first.
  Deterministic across processes and platforms.
*/
UUID DeriveUUID(std::string_view name);

/*
  Generation-1 text identifier -> generation-2 UUID.

  UUID-shaped text keeps its bytes, anything else goes through DeriveUUID.
  Callers holding old text ids can recompute the mapping with this.
*/
UUID LegacyUUID(std::string_view text);

struct UUIDHash {
  std::size_t operator()(const UUID& id) const noexcept;
};

} // namespace valuegraph::util
