#include "db_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace valuegraph::core {

void ThrowIfDbError(const valuegraph::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case valuegraph::db::ErrorCode::NotFound:
      throw valuegraph::util::NotFound(message);
    case valuegraph::db::ErrorCode::DuplicateIdentifier:
      throw valuegraph::util::DuplicateIdentifier(message);
    case valuegraph::db::ErrorCode::MalformedIdentifier:
      throw valuegraph::util::MalformedIdentifier(message);
    case valuegraph::db::ErrorCode::MigrationFailed:
      throw valuegraph::util::MigrationFailed(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace valuegraph::core
