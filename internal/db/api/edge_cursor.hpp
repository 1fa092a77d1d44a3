#pragma once

#include <optional>

#include "internal/db/model/link_record.hpp"

namespace valuegraph::db {

/*
  Forward-only, lazily evaluated edge sequence.

  A cursor is bound to the transaction it was opened in and must be
  destroyed before that transaction ends.
*/

class EdgeCursor {
 public:
  virtual ~EdgeCursor() = default;

  // Next edge in handle order, or nullopt once exhausted.
  virtual std::optional<model::LinkRecord> Next() = 0;
};

} // namespace valuegraph::db
