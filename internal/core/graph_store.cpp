#include "graph_store.hpp"

#include <stdexcept>
#include <utility>

namespace valuegraph::core {

GraphStore::GraphStore(std::shared_ptr<valuegraph::db::Repository> repository)
    : repository_(std::move(repository)), values_(repository_), links_(repository_) {
  if (!repository_) throw std::invalid_argument("GraphStore requires a repository");
}

valuegraph::db::Generation GraphStore::Generation() {
  auto tx         = repository_->BeginRead();
  auto generation = repository_->SchemaGeneration(*tx);
  tx->Commit();
  return generation;
}

} // namespace valuegraph::core
