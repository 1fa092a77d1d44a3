#include "link_store.hpp"

#include <string>
#include <utility>

#include "db_error.hpp"

namespace valuegraph::core {

EdgeRange::EdgeRange(std::shared_ptr<valuegraph::db::Repository> repository, Open open, std::size_t page_size)
    : repository_(std::move(repository)), open_(std::move(open)), page_size_(page_size == 0 ? 1 : page_size) {
}

void EdgeRange::FetchPage() {
  std::vector<LinkRecord> page;
  bool                    exhausted = false;

  auto tx = repository_->BeginRead();
  {
    // the cursor must not outlive its transaction
    auto cursor = open_(*tx, last_);
    while (page.size() < page_size_) {
      auto edge = cursor->Next();
      if (!edge) {
        exhausted = true;
        break;
      }
      page.push_back(std::move(*edge));
    }
  }
  tx->Commit();

  page_      = std::move(page);
  pos_       = 0;
  exhausted_ = exhausted;
  if (!page_.empty()) last_ = page_.back().handle;
}

std::optional<LinkRecord> EdgeRange::Next() {
  if (pos_ == page_.size()) {
    if (exhausted_) return std::nullopt;
    FetchPage();
    if (page_.empty()) return std::nullopt;
  }
  return page_[pos_++];
}

std::vector<LinkRecord> EdgeRange::ToVector() {
  std::vector<LinkRecord> edges;
  while (auto edge = Next()) {
    edges.push_back(std::move(*edge));
  }
  return edges;
}

LinkStore::LinkStore(std::shared_ptr<valuegraph::db::Repository> repository, std::size_t page_size)
    : repository_(std::move(repository)), page_size_(page_size) {
}

EdgeHandle LinkStore::AddEdge(const util::UUID& source, const std::optional<util::UUID>& key, const util::UUID& target) {
  LinkRecord link;
  link.source = source;
  link.key    = key;
  link.target = target;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertLink(*tx, link), "add edge from " + util::ToString(source));
  tx->Commit();
  return link.handle;
}

bool LinkStore::RemoveEdge(EdgeHandle handle) {
  auto tx     = repository_->Begin();
  auto result = repository_->DeleteLink(*tx, handle);
  if (result.code == valuegraph::db::ErrorCode::NotFound) {
    return false;
  }
  ThrowIfDbError(result, "remove edge " + std::to_string(handle));
  tx->Commit();
  return true;
}

EdgeRange LinkStore::Traverse(EdgeRange::Open open) {
  return EdgeRange(repository_, std::move(open), page_size_);
}

EdgeRange LinkStore::EdgesFrom(const util::UUID& source) {
  return Traverse([repository = repository_, source](valuegraph::db::Transaction& tx, EdgeHandle after) {
    return repository->EdgesFrom(tx, source, after);
  });
}

EdgeRange LinkStore::EdgesFromWithKey(const util::UUID& source, const util::UUID& key) {
  return Traverse([repository = repository_, source, key](valuegraph::db::Transaction& tx, EdgeHandle after) {
    return repository->EdgesFromWithKey(tx, source, key, after);
  });
}

EdgeRange LinkStore::EdgesByKey(const util::UUID& key) {
  return Traverse([repository = repository_, key](valuegraph::db::Transaction& tx, EdgeHandle after) {
    return repository->EdgesByKey(tx, key, after);
  });
}

EdgeRange LinkStore::EdgesTo(const util::UUID& target) {
  return Traverse([repository = repository_, target](valuegraph::db::Transaction& tx, EdgeHandle after) {
    return repository->EdgesTo(tx, target, after);
  });
}

uint64_t LinkStore::Count() {
  auto tx    = repository_->BeginRead();
  auto count = repository_->CountLinks(*tx);
  tx->Commit();
  return count;
}

} // namespace valuegraph::core
