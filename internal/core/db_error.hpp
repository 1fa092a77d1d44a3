#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace valuegraph::core {

// Translates a failed db::Result into the matching util:: exception.
void ThrowIfDbError(const valuegraph::db::Result& result, const std::string& context);

} // namespace valuegraph::core
