#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/value.hpp"
#include "internal/util/uuid.hpp"

namespace valuegraph::core {

/*
  Value Records keyed by 16 byte id.

  Each call runs in its own transaction. Deleting a value leaves links
  that reference it in place.
*/
class ValueStore {
 public:
  explicit ValueStore(std::shared_ptr<valuegraph::db::Repository> repository);

  // Upsert: replaces the payload when the id already exists.
  void Put(const util::UUID& id, const valuegraph::model::Value& value);

  // Throws util::DuplicateIdentifier when the id exists.
  void Insert(const util::UUID& id, const valuegraph::model::Value& value);

  // Throws util::NotFound.
  valuegraph::model::Value Get(const util::UUID& id);

  bool Contains(const util::UUID& id);

  // false when nothing was stored under id.
  bool Delete(const util::UUID& id);

  std::vector<util::UUID> FindByString(std::string_view text);

  uint64_t Count();

 private:
  std::shared_ptr<valuegraph::db::Repository> repository_;
};

} // namespace valuegraph::core
