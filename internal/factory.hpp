#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/alerts/alert_engine.hpp"
#include "internal/db/api/dataset_reader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/detection/orchestrator.hpp"
#include "internal/relationships/relationship_store.hpp"

namespace fraudit::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects of one detection process.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>    repository;
  std::shared_ptr<db::DatasetReader> dataset;

  std::shared_ptr<relationships::RelationshipStore> relationships;
  std::shared_ptr<alerts::AlertEngine>              alerts;
  std::shared_ptr<detection::Orchestrator>          orchestrator;
};

/*
  BuildRuntime

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
RuntimeDependencies BuildRuntime(const fraudit::config::RuntimeConfig& config);

// Same graph over caller-supplied storage; used by tests and tooling.
RuntimeDependencies BuildRuntime(const fraudit::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                                 std::shared_ptr<db::DatasetReader> dataset);

} // namespace fraudit::factory
