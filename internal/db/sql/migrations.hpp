#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/generation.hpp"
#include "internal/db/api/transaction.hpp"

namespace valuegraph::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor; steps carry backend SQL.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  // Exclusive access for the whole step; rolls back unless committed.
  virtual std::unique_ptr<Transaction> BeginExclusive() = 0;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Runs a query returning a single integer (COUNT(*) and friends).
  virtual int64_t QueryCount(const std::string& sql) = 0;

  virtual Generation ReadGeneration()                 = 0;
  virtual void       WriteGeneration(Generation generation) = 0;
};

// Row count that must survive a copy-forward unchanged.
struct CopyVerification {
  std::string what;
  std::string source_count_sql;
  std::string copied_count_sql;
};

// Query returning the number of offending rows; non-zero is a warning.
struct IntegrityProbe {
  std::string name;
  std::string sql;
};

/*
  One generation transition, from -> to.

  Phases run in order inside one exclusive transaction:
    drop_indexes, structure, copy, verify, swap, build_indexes, integrity,
  then the new generation is recorded.

  Non-destructive steps only create missing objects and may be re-applied
  to a store already at `to`. Destructive steps run only at exactly `from`.
*/
struct MigrationStep {
  Generation  from = 0;
  Generation  to   = 0;
  std::string name;
  bool        destructive = false;

  std::vector<std::string>      drop_indexes;
  std::vector<std::string>      structure;
  std::vector<std::string>      copy;
  std::vector<CopyVerification> verify;
  std::vector<std::string>      swap;
  std::vector<std::string>      build_indexes;
  std::vector<IntegrityProbe>   integrity;
};

struct IntegrityWarning {
  Generation  generation = 0;
  std::string probe;
  int64_t     count = 0;
};

struct IntegrityReport {
  std::vector<IntegrityWarning> warnings;

  bool Clean() const {
    return warnings.empty();
  }
};

struct MigrationOptions {
  Generation target          = kLatestGeneration;
  bool       integrity_check = true;
};

struct MigrationOutcome {
  Generation              from = 0;
  Generation              to   = 0;
  std::vector<Generation> applied;
  IntegrityReport         integrity;
};

/*
  Applies a single step in its own exclusive transaction.
  Throws util::MigrationFailed; the recorded generation is then unchanged.
*/
IntegrityReport ApplyStep(MigrationExecutor& executor, const MigrationStep& step, bool integrity_check = true);

/*
  Runs pending steps in order until options.target.

  Fails without touching the store if the recorded generation is newer than
  the last step, or if the target would regress it.
*/
MigrationOutcome RunMigrations(MigrationExecutor& executor, const std::vector<MigrationStep>& ordered_steps,
                               const MigrationOptions& options = {});

} // namespace valuegraph::db::sql
