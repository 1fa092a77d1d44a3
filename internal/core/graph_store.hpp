#pragma once

#include <memory>

#include "internal/db/api/generation.hpp"
#include "internal/db/api/repository.hpp"
#include "link_store.hpp"
#include "value_store.hpp"

namespace valuegraph::core {

/*
  Open store: one repository at kLatestGeneration plus the value and link
  views over it. Built by factory::OpenStore.
*/
class GraphStore {
 public:
  explicit GraphStore(std::shared_ptr<valuegraph::db::Repository> repository);

  ValueStore& Values() {
    return values_;
  }

  LinkStore& Links() {
    return links_;
  }

  valuegraph::db::Generation Generation();

  const std::shared_ptr<valuegraph::db::Repository>& Backend() const {
    return repository_;
  }

 private:
  std::shared_ptr<valuegraph::db::Repository> repository_;
  ValueStore                                  values_;
  LinkStore                                   links_;
};

} // namespace valuegraph::core
