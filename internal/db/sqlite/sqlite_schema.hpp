#pragma once

#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace valuegraph::db::sqlite {

// SQL function used by the generation 1 -> 2 copy: TEXT id -> 16 byte BLOB.
inline constexpr const char* kLegacyUuidFunction = "vg_legacy_uuid";

// 0 -> 1: text identifiers; create-if-absent, safe to re-apply.
sql::MigrationStep Generation1Step();

// 1 -> 2: rewrite to 16 byte identifiers, string and target indexes.
sql::MigrationStep Generation2Step();

// Every step in order, 0 -> kLatestGeneration.
std::vector<sql::MigrationStep> MigrationSteps();

} // namespace valuegraph::db::sqlite
