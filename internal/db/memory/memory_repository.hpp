#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace valuegraph::db::memory {

class MemoryTransaction;

/*
  In-process store, always at kLatestGeneration.

  Hash indexes mirror the SQLite index set; handle sets are ordered so
  traversal yields edges in insertion order like the SQLite backend.
  Values carry an insertion sequence that plays the role of the SQLite
  rowid, so string lookups come back in the same order on both backends.

  The committed state is immutable and shared: readers pin it without
  copying, a writer copies it once and publishes a new state on commit.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;
  Generation SchemaGeneration(Transaction&) override;

  Result UpsertValue(Transaction&, const model::ValueRecord&) override;
  Result InsertValue(Transaction&, const model::ValueRecord&) override;
  std::optional<model::ValueRecord> GetValue(Transaction&, const util::UUID&) override;
  Result DeleteValue(Transaction&, const util::UUID&) override;
  std::vector<util::UUID> FindValuesByString(Transaction&, std::string_view) override;
  uint64_t CountValues(Transaction&) override;

  Result InsertLink(Transaction&, model::LinkRecord&) override;
  Result DeleteLink(Transaction&, model::EdgeHandle) override;
  std::unique_ptr<EdgeCursor> EdgesFrom(Transaction&, const util::UUID&, model::EdgeHandle) override;
  std::unique_ptr<EdgeCursor> EdgesFromWithKey(Transaction&, const util::UUID&, const util::UUID&, model::EdgeHandle) override;
  std::unique_ptr<EdgeCursor> EdgesByKey(Transaction&, const util::UUID&, model::EdgeHandle) override;
  std::unique_ptr<EdgeCursor> EdgesTo(Transaction&, const util::UUID&, model::EdgeHandle) override;
  uint64_t CountLinks(Transaction&) override;

private:
  friend class MemoryTransaction;

  using HandleSet = std::set<model::EdgeHandle>;

  struct StoredValue {
    uint64_t           seq = 0;
    model::ValueRecord record;
  };

  struct State {
    std::unordered_map<util::UUID, StoredValue, util::UUIDHash> values;
    // string payload -> (insertion sequence -> id)
    std::map<std::string, std::map<uint64_t, util::UUID>> strings;
    uint64_t next_seq = 1;

    std::map<model::EdgeHandle, model::LinkRecord> links;
    std::unordered_map<util::UUID, HandleSet, util::UUIDHash> by_source;
    std::unordered_map<util::UUID, HandleSet, util::UUIDHash> by_key;
    std::unordered_map<util::UUID, HandleSet, util::UUIDHash> by_target;
    std::map<std::pair<util::UUID, util::UUID>, HandleSet> by_source_key;

    model::EdgeHandle next_handle = 1;
  };

  static void IndexString(State& s, const StoredValue& v);
  static void UnindexString(State& s, const StoredValue& v);

  template <typename Index, typename Key>
  static std::unique_ptr<EdgeCursor> Cursor(const State& s, const Index& index, Key key, model::EdgeHandle after);

  std::mutex mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t committed_version_ = 0;
};

}
