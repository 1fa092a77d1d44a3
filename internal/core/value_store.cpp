#include "value_store.hpp"

#include <utility>

#include "db_error.hpp"
#include "internal/util/errors.hpp"

namespace valuegraph::core {

ValueStore::ValueStore(std::shared_ptr<valuegraph::db::Repository> repository) : repository_(std::move(repository)) {
}

void ValueStore::Put(const util::UUID& id, const valuegraph::model::Value& value) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertValue(*tx, {id, value}), "put value " + util::ToString(id));
  tx->Commit();
}

void ValueStore::Insert(const util::UUID& id, const valuegraph::model::Value& value) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertValue(*tx, {id, value}), "insert value " + util::ToString(id));
  tx->Commit();
}

valuegraph::model::Value ValueStore::Get(const util::UUID& id) {
  auto tx     = repository_->BeginRead();
  auto record = repository_->GetValue(*tx, id);
  tx->Commit();

  if (!record.has_value()) throw util::NotFound("get value: " + util::ToString(id) + " not found");
  return std::move(record->value);
}

bool ValueStore::Contains(const util::UUID& id) {
  auto tx    = repository_->BeginRead();
  bool found = repository_->GetValue(*tx, id).has_value();
  tx->Commit();
  return found;
}

bool ValueStore::Delete(const util::UUID& id) {
  auto tx     = repository_->Begin();
  auto result = repository_->DeleteValue(*tx, id);
  if (result.code == valuegraph::db::ErrorCode::NotFound) {
    return false;
  }
  ThrowIfDbError(result, "delete value " + util::ToString(id));
  tx->Commit();
  return true;
}

std::vector<util::UUID> ValueStore::FindByString(std::string_view text) {
  auto tx  = repository_->BeginRead();
  auto ids = repository_->FindValuesByString(*tx, text);
  tx->Commit();
  return ids;
}

uint64_t ValueStore::Count() {
  auto tx    = repository_->BeginRead();
  auto count = repository_->CountValues(*tx);
  tx->Commit();
  return count;
}

} // namespace valuegraph::core
