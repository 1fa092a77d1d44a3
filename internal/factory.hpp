#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/graph_store.hpp"
#include "internal/db/sql/migrations.hpp"

namespace valuegraph::factory {

/*
  OpenStore

  Builds the backend named by config.database(), migrates a SQLite store to
  kLatestGeneration, and returns the facade over it. A missing backend
  section selects the memory backend.

  NOTE:
  This is the composition root of the library.
  It is the ONLY place allowed to know concrete DB types.

  Throws util::MigrationFailed when the store cannot be brought to the
  latest generation; the store file is then left at its old generation.
*/
std::unique_ptr<core::GraphStore> OpenStore(const valuegraph::runtime::config::RuntimeConfig& config);

// Same as OpenStore; also reports what the migration run did.
std::unique_ptr<core::GraphStore> OpenStore(const valuegraph::runtime::config::RuntimeConfig& config,
                                            db::sql::MigrationOutcome*                        outcome);

} // namespace valuegraph::factory
