#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/config/thresholds.hpp"
#include "internal/db/memory/memory_dataset.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_dataset.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/detection/registry.hpp"
#include "internal/match/matching_engine.hpp"
#include "internal/observability/logging.hpp"

namespace fraudit::factory {

using fraudit::observability::StringField;

namespace {

struct Storage {
  std::shared_ptr<db::Repository>    repository;
  std::shared_ptr<db::DatasetReader> dataset;
};

Storage BuildStorage(const fraudit::config::RuntimeConfig& config) {
  const auto& database = config.database();

  if (database.backend() == "sqlite") {
    const auto& path = database.sqlite().path();
    if (path.empty()) {
      throw std::runtime_error("database.sqlite.path is required for the sqlite backend");
    }

    auto write_db = std::make_shared<db::sqlite::SqliteDB>(path);
    db::sqlite::BootstrapSchema(*write_db);

    // separate read connection for the dataset
    auto read_db = std::make_shared<db::sqlite::SqliteDB>(path);

    FRAUDIT_LOG_INFO("storage ready", {StringField("backend", "sqlite"), StringField("path", path)});
    return {std::make_shared<db::sqlite::SqliteRepository>(std::move(write_db)),
            std::make_shared<db::sqlite::SqliteDataset>(std::move(read_db))};
  }

  if (database.backend().empty() || database.backend() == "memory") {
    FRAUDIT_LOG_INFO("storage ready", {StringField("backend", "memory")});
    return {std::make_shared<db::memory::MemoryRepository>(), std::make_shared<db::memory::MemoryDataset>()};
  }

  throw std::runtime_error("unknown database backend: " + database.backend());
}

} // namespace

RuntimeDependencies BuildRuntime(const fraudit::config::RuntimeConfig& config) {
  auto storage = BuildStorage(config);
  return BuildRuntime(config, std::move(storage.repository), std::move(storage.dataset));
}

RuntimeDependencies BuildRuntime(const fraudit::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                                 std::shared_ptr<db::DatasetReader> dataset) {
  RuntimeDependencies deps;
  deps.repository = std::move(repository);
  deps.dataset    = std::move(dataset);

  // ------------------------------------------------------------------
  // Write side
  // ------------------------------------------------------------------
  deps.relationships = std::make_shared<relationships::RelationshipStore>(deps.repository);
  deps.alerts        = std::make_shared<alerts::AlertEngine>(deps.repository);

  // ------------------------------------------------------------------
  // Detection
  // ------------------------------------------------------------------
  match::MatchingEngine matcher(match::MatchingOptions::FromConfig(config.matching()));
  config::Thresholds    thresholds(config.detection());

  deps.orchestrator = std::make_shared<detection::Orchestrator>(detection::RuleRegistry::Default(), deps.dataset, deps.relationships,
                                                                deps.alerts, std::move(matcher), std::move(thresholds),
                                                                detection::OrchestratorOptions::FromConfig(config));
  return deps;
}

} // namespace fraudit::factory
