#pragma once

#include <cstdint>

namespace valuegraph::db {

/*
  Schema generation recorded in store metadata.

  0: empty store
  1: text identifiers
  2: 16 byte binary identifiers, string and target indexes
*/

using Generation = int32_t;

inline constexpr Generation kEmptyGeneration  = 0;
inline constexpr Generation kLatestGeneration = 2;

} // namespace valuegraph::db
