#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/uuid.hpp"

namespace valuegraph::core {

using valuegraph::db::model::EdgeHandle;
using valuegraph::db::model::LinkRecord;

/*
  Lazy result of a traversal.

  Edges are fetched in pages in handle order. Each page is read in its own
  short read transaction, and nothing is held between Next() calls, so the
  caller may resolve endpoints or start other traversals while iterating.
  Edges committed between pages are seen when their handle lies beyond the
  last one returned; removed edges are not returned once their page is read.
*/
class EdgeRange {
 public:
  using Open =
      std::function<std::unique_ptr<valuegraph::db::EdgeCursor>(valuegraph::db::Transaction&, EdgeHandle after)>;

  EdgeRange(std::shared_ptr<valuegraph::db::Repository> repository, Open open, std::size_t page_size);

  std::optional<LinkRecord> Next();

  // Drains the remaining edges.
  std::vector<LinkRecord> ToVector();

 private:
  void FetchPage();

  std::shared_ptr<valuegraph::db::Repository> repository_;
  Open                                        open_;
  std::size_t                                 page_size_;
  std::vector<LinkRecord>                     page_;
  std::size_t                                 pos_       = 0;
  EdgeHandle                                  last_      = valuegraph::db::model::kNoEdge;
  bool                                        exhausted_ = false;
};

/*
  Directed multigraph of Link Records.

  Endpoints are never checked against the values table. Adding the same
  (source, key, target) twice yields two edges with distinct handles.
*/
class LinkStore {
 public:
  static constexpr std::size_t kDefaultPageSize = 256;

  explicit LinkStore(std::shared_ptr<valuegraph::db::Repository> repository, std::size_t page_size = kDefaultPageSize);

  EdgeHandle AddEdge(const util::UUID& source, const std::optional<util::UUID>& key, const util::UUID& target);

  // false when no edge has this handle.
  bool RemoveEdge(EdgeHandle handle);

  EdgeRange EdgesFrom(const util::UUID& source);
  EdgeRange EdgesFromWithKey(const util::UUID& source, const util::UUID& key);
  EdgeRange EdgesByKey(const util::UUID& key);
  EdgeRange EdgesTo(const util::UUID& target);

  uint64_t Count();

 private:
  EdgeRange Traverse(EdgeRange::Open open);

  std::shared_ptr<valuegraph::db::Repository> repository_;
  std::size_t                                 page_size_;
};

} // namespace valuegraph::core
