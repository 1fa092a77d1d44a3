#include "internal/db/sql/migrations.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace valuegraph::db::sql {

using observability::IntField;
using observability::StringField;

namespace {

std::string StepLabel(const MigrationStep& step) {
  return "generation " + std::to_string(step.from) + " -> " + std::to_string(step.to) + " (" + step.name + ")";
}

void ExecuteAll(MigrationExecutor& executor, const std::vector<std::string>& statements) {
  for (const auto& sql : statements) {
    executor.ExecuteSQL(sql);
  }
}

void VerifyCopies(MigrationExecutor& executor, const MigrationStep& step) {
  for (const auto& check : step.verify) {
    const auto source = executor.QueryCount(check.source_count_sql);
    const auto copied = executor.QueryCount(check.copied_count_sql);
    if (source != copied) {
      throw util::MigrationFailed(StepLabel(step) + ": " + check.what + " copy lost rows (" + std::to_string(source) + " before, " +
                                  std::to_string(copied) + " after)");
    }
  }
}

IntegrityReport RunProbes(MigrationExecutor& executor, const MigrationStep& step) {
  IntegrityReport report;
  for (const auto& probe : step.integrity) {
    const auto count = executor.QueryCount(probe.sql);
    if (count == 0) continue;

    VALUEGRAPH_LOG_WARN("Integrity warning",
                        {IntField("generation", step.to), StringField("probe", probe.name), IntField("rows", count)});
    report.warnings.push_back({step.to, probe.name, count});
  }
  return report;
}

} // namespace

IntegrityReport ApplyStep(MigrationExecutor& executor, const MigrationStep& step, bool integrity_check) {
  try {
    auto tx = executor.BeginExclusive();

    const auto current = executor.ReadGeneration();
    if (current > step.to) {
      // already past this step; nothing here applies to the newer layout
      tx->Commit();
      return {};
    }
    if (step.destructive && current != step.from) {
      throw util::MigrationFailed(StepLabel(step) + ": store is at generation " + std::to_string(current));
    }
    if (current < step.from) {
      throw util::MigrationFailed(StepLabel(step) + ": store is at generation " + std::to_string(current) + ", earlier steps pending");
    }

    ExecuteAll(executor, step.drop_indexes);
    ExecuteAll(executor, step.structure);
    ExecuteAll(executor, step.copy);
    VerifyCopies(executor, step);
    ExecuteAll(executor, step.swap);
    ExecuteAll(executor, step.build_indexes);

    IntegrityReport report;
    if (integrity_check) {
      report = RunProbes(executor, step);
    }

    if (current < step.to) {
      executor.WriteGeneration(step.to);
    }
    tx->Commit();
    return report;
  } catch (const util::MigrationFailed&) {
    throw;
  } catch (const std::exception& e) {
    throw util::MigrationFailed(StepLabel(step) + ": " + e.what());
  }
}

MigrationOutcome RunMigrations(MigrationExecutor& executor, const std::vector<MigrationStep>& ordered_steps,
                               const MigrationOptions& options) {
  Generation latest = kEmptyGeneration;
  for (const auto& step : ordered_steps) {
    if (step.from != latest || step.to != step.from + 1) {
      throw util::MigrationFailed("migration steps are not contiguous at " + StepLabel(step));
    }
    latest = step.to;
  }

  MigrationOutcome outcome;
  outcome.from = executor.ReadGeneration();

  if (outcome.from < kEmptyGeneration || outcome.from > latest) {
    throw util::MigrationFailed("store generation " + std::to_string(outcome.from) + " is not supported (latest known " +
                                std::to_string(latest) + ")");
  }
  if (options.target > latest || options.target < outcome.from) {
    throw util::MigrationFailed("cannot migrate from generation " + std::to_string(outcome.from) + " to " +
                                std::to_string(options.target));
  }

  for (const auto& step : ordered_steps) {
    if (step.to <= outcome.from) continue;
    if (step.to > options.target) break;

    VALUEGRAPH_LOG_INFO("Migrating", {IntField("from", step.from), IntField("to", step.to), StringField("step", step.name)});
    try {
      auto report = ApplyStep(executor, step, options.integrity_check);
      outcome.integrity.warnings.insert(outcome.integrity.warnings.end(), report.warnings.begin(), report.warnings.end());
    } catch (const util::MigrationFailed& e) {
      VALUEGRAPH_LOG_ERROR("Migration failed", {IntField("to", step.to), StringField("error", e.what())});
      throw;
    }
    outcome.applied.push_back(step.to);
    VALUEGRAPH_LOG_INFO("Migrated", {IntField("generation", step.to)});
  }

  outcome.to = executor.ReadGeneration();
  return outcome;
}

} // namespace valuegraph::db::sql
