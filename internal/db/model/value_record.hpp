#pragma once

#include "internal/model/value.hpp"
#include "internal/util/uuid.hpp"

namespace valuegraph::db::model {

/*
  Persistent value row.

  - id is the generation-2 primary key (16 byte UUID).
  - value holds at most one payload; it is stored as a sparse row with
    one nullable column per scalar type.
*/

struct ValueRecord {
  util::UUID id{};

  valuegraph::model::Value value;
};

} // namespace valuegraph::db::model
