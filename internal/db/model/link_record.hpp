#pragma once

#include <cstdint>
#include <optional>

#include "internal/util/uuid.hpp"

namespace valuegraph::db::model {

// Identifies one inserted edge. SQLite: links rowid. Memory: insertion sequence.
using EdgeHandle = int64_t;

// Below every real handle; traversals started after it yield all edges.
inline constexpr EdgeHandle kNoEdge = 0;

/*
  Directed, optionally labeled edge.

    source --[key]--> target

  Endpoints are not required to exist in the values table; readers must
  tolerate dangling ids. Identical tuples may coexist, each with its own handle.
*/

struct LinkRecord {
  EdgeHandle handle = 0;

  util::UUID                source{};
  std::optional<util::UUID> key;
  util::UUID                target{};
};

} // namespace valuegraph::db::model
