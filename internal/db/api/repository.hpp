#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/db/api/edge_cursor.hpp"
#include "internal/db/api/generation.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/link_record.hpp"
#include "internal/db/model/value_record.hpp"

namespace valuegraph::db {

/*
  Repository abstraction over one generation-2 store.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Link writes never check that endpoints exist in the values table
  - Cursors returned by traversal calls live inside the transaction
    they were opened in and yield edges with a handle above `after`,
    in handle order (keyset paging)

  Backends: SQLite (persistent), memory (tests / ephemeral stores).
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Read-only transaction; Commit() only releases it.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  virtual Generation SchemaGeneration(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Values
  // ---------------------------------------------------------------------

  // Insert or replace the payload of an existing id.
  virtual Result UpsertValue(Transaction&, const model::ValueRecord&) = 0;

  // Insert-only; DuplicateIdentifier if the id exists.
  virtual Result InsertValue(Transaction&, const model::ValueRecord&) = 0;

  virtual std::optional<model::ValueRecord> GetValue(Transaction&, const util::UUID& id) = 0;

  // NotFound if no row was removed.
  virtual Result DeleteValue(Transaction&, const util::UUID& id) = 0;

  // Exact match on the string payload. Ids come back in the order their
  // values were first inserted; an upsert keeps the original position.
  virtual std::vector<util::UUID> FindValuesByString(Transaction&, std::string_view text) = 0;

  virtual uint64_t CountValues(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Links
  // ---------------------------------------------------------------------

  // Assigns link.handle on success.
  virtual Result InsertLink(Transaction&, model::LinkRecord& link) = 0;

  // NotFound if the handle does not exist.
  virtual Result DeleteLink(Transaction&, model::EdgeHandle handle) = 0;

  // Pass model::kNoEdge as `after` to start from the first edge.
  virtual std::unique_ptr<EdgeCursor> EdgesFrom(Transaction&, const util::UUID& source, model::EdgeHandle after) = 0;

  virtual std::unique_ptr<EdgeCursor> EdgesFromWithKey(Transaction&, const util::UUID& source, const util::UUID& key,
                                                       model::EdgeHandle after) = 0;

  virtual std::unique_ptr<EdgeCursor> EdgesByKey(Transaction&, const util::UUID& key, model::EdgeHandle after) = 0;

  virtual std::unique_ptr<EdgeCursor> EdgesTo(Transaction&, const util::UUID& target, model::EdgeHandle after) = 0;

  virtual uint64_t CountLinks(Transaction&) = 0;
};

} // namespace valuegraph::db
