#include "memory_repository.hpp"

#include <functional>
#include <vector>

#include "memory_tx.hpp"

namespace valuegraph::db::memory {

namespace {

/*
  Walks one handle index from `after` upward. The index is looked up
  again on every step, so edges removed or added later in the same
  transaction are honored without copying the handle set.
*/
class MemoryEdgeCursor final : public EdgeCursor {
 public:
  using Lookup = std::function<const std::set<model::EdgeHandle>*()>;

  MemoryEdgeCursor(const std::map<model::EdgeHandle, model::LinkRecord>& links, Lookup lookup, model::EdgeHandle after)
      : links_(links), lookup_(std::move(lookup)), last_(after) {}

  std::optional<model::LinkRecord> Next() override {
    const auto* handles = lookup_();
    if (!handles) return std::nullopt;

    for (auto it = handles->upper_bound(last_); it != handles->end(); ++it) {
      last_     = *it;
      auto link = links_.find(last_);
      if (link != links_.end()) return link->second;
    }
    return std::nullopt;
  }

 private:
  const std::map<model::EdgeHandle, model::LinkRecord>& links_;
  Lookup                                                lookup_;
  model::EdgeHandle                                     last_;
};

template <typename Index, typename Key>
void Unlink(Index& index, const Key& key, model::EdgeHandle handle) {
  auto it = index.find(key);
  if (it == index.end()) return;
  it->second.erase(handle);
  if (it->second.empty()) index.erase(it);
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Generation MemoryRepository::SchemaGeneration(Transaction&) {
  return kLatestGeneration;
}

void MemoryRepository::IndexString(State& s, const StoredValue& v) {
  if (const auto* str = std::get_if<std::string>(&v.record.value)) {
    s.strings[*str].emplace(v.seq, v.record.id);
  }
}

void MemoryRepository::UnindexString(State& s, const StoredValue& v) {
  const auto* str = std::get_if<std::string>(&v.record.value);
  if (!str) return;

  auto it = s.strings.find(*str);
  if (it == s.strings.end()) return;
  it->second.erase(v.seq);
  if (it->second.empty()) s.strings.erase(it);
}

// ------------------------------------------------------------------
// Values
// ------------------------------------------------------------------

Result MemoryRepository::UpsertValue(Transaction& t, const model::ValueRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.values.find(r.id);
  if (it != s.values.end()) {
    // replaced in place; the value keeps its position
    UnindexString(s, it->second);
    it->second.record = r;
  } else {
    it = s.values.emplace(r.id, StoredValue{s.next_seq++, r}).first;
  }
  IndexString(s, it->second);
  return Result::Ok();
}

Result MemoryRepository::InsertValue(Transaction& t, const model::ValueRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.values.contains(r.id)) {
    return Result::Err(ErrorCode::DuplicateIdentifier, "value " + util::ToString(r.id) + " already exists");
  }
  auto it = s.values.emplace(r.id, StoredValue{s.next_seq++, r}).first;
  IndexString(s, it->second);
  return Result::Ok();
}

std::optional<model::ValueRecord> MemoryRepository::GetValue(Transaction& t, const util::UUID& id) {
  const auto& s  = TX(t).View();
  auto        it = s.values.find(id);
  if (it == s.values.end()) return std::nullopt;
  return it->second.record;
}

Result MemoryRepository::DeleteValue(Transaction& t, const util::UUID& id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.values.find(id);
  if (it == s.values.end()) return Result::Err(ErrorCode::NotFound);

  // links pointing at the value stay
  UnindexString(s, it->second);
  s.values.erase(it);
  return Result::Ok();
}

std::vector<util::UUID> MemoryRepository::FindValuesByString(Transaction& t, std::string_view text) {
  const auto& s  = TX(t).View();
  auto        it = s.strings.find(std::string(text));
  if (it == s.strings.end()) return {};

  std::vector<util::UUID> ids;
  ids.reserve(it->second.size());
  for (const auto& [seq, id] : it->second) {
    ids.push_back(id);
  }
  return ids;
}

uint64_t MemoryRepository::CountValues(Transaction& t) {
  return TX(t).View().values.size();
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

Result MemoryRepository::InsertLink(Transaction& t, model::LinkRecord& r) {
  auto& s  = TX(t).Mutable();
  r.handle = s.next_handle++;

  s.links.emplace(r.handle, r);
  s.by_source[r.source].insert(r.handle);
  s.by_target[r.target].insert(r.handle);
  if (r.key) {
    s.by_key[*r.key].insert(r.handle);
    s.by_source_key[{r.source, *r.key}].insert(r.handle);
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteLink(Transaction& t, model::EdgeHandle handle) {
  auto& s  = TX(t).Mutable();
  auto  it = s.links.find(handle);
  if (it == s.links.end()) return Result::Err(ErrorCode::NotFound);

  const auto& r = it->second;
  Unlink(s.by_source, r.source, handle);
  Unlink(s.by_target, r.target, handle);
  if (r.key) {
    Unlink(s.by_key, *r.key, handle);
    Unlink(s.by_source_key, std::make_pair(r.source, *r.key), handle);
  }
  s.links.erase(it);
  return Result::Ok();
}

template <typename Index, typename Key>
std::unique_ptr<EdgeCursor> MemoryRepository::Cursor(const State& s, const Index& index, Key key, model::EdgeHandle after) {
  auto lookup = [&index, key = std::move(key)]() -> const HandleSet* {
    auto it = index.find(key);
    return it == index.end() ? nullptr : &it->second;
  };
  return std::make_unique<MemoryEdgeCursor>(s.links, std::move(lookup), after);
}

std::unique_ptr<EdgeCursor> MemoryRepository::EdgesFrom(Transaction& t, const util::UUID& source, model::EdgeHandle after) {
  const auto& s = TX(t).View();
  return Cursor(s, s.by_source, source, after);
}

std::unique_ptr<EdgeCursor> MemoryRepository::EdgesFromWithKey(Transaction& t, const util::UUID& source, const util::UUID& key,
                                                              model::EdgeHandle after) {
  const auto& s = TX(t).View();
  return Cursor(s, s.by_source_key, std::make_pair(source, key), after);
}

std::unique_ptr<EdgeCursor> MemoryRepository::EdgesByKey(Transaction& t, const util::UUID& key, model::EdgeHandle after) {
  const auto& s = TX(t).View();
  return Cursor(s, s.by_key, key, after);
}

std::unique_ptr<EdgeCursor> MemoryRepository::EdgesTo(Transaction& t, const util::UUID& target, model::EdgeHandle after) {
  const auto& s = TX(t).View();
  return Cursor(s, s.by_target, target, after);
}

uint64_t MemoryRepository::CountLinks(Transaction& t) {
  return TX(t).View().links.size();
}

} // namespace valuegraph::db::memory
