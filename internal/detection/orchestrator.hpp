#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/alerts/alert_engine.hpp"
#include "internal/config/thresholds.hpp"
#include "internal/db/api/dataset_reader.hpp"
#include "internal/detection/registry.hpp"
#include "internal/match/matching_engine.hpp"
#include "internal/relationships/relationship_store.hpp"
#include "internal/util/time.hpp"
#include "internal/work/cancellation.hpp"

namespace fraudit::detection {

enum class TaskStatus {
  kPending,
  kRunning,
  kSuccess,
  kFailed,
};

constexpr std::string_view ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kPending:
      return "pending";
    case TaskStatus::kRunning:
      return "running";
    case TaskStatus::kSuccess:
      return "success";
    case TaskStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

// Run-scoped record of one rule execution.
struct DetectionTask {
  std::string                    rule_name;
  TaskStatus                     status      = TaskStatus::kPending;
  std::size_t                    alert_count = 0;
  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> finished_at;
  std::string                    error;

  double Seconds() const {
    if (!started_at || !finished_at) {
      return 0.0;
    }
    return util::SecondsBetween(*started_at, *finished_at);
  }
};

struct RunSummary {
  std::size_t                total_alerts = 0;
  std::size_t                succeeded    = 0;
  std::size_t                failed       = 0;
  std::size_t                cancelled    = 0;
  std::vector<DetectionTask> tasks;
};

struct OrchestratorOptions {
  std::size_t              max_workers             = 6;
  std::size_t              max_candidates_per_item = 10;
  std::vector<std::string> enabled_rules;
  util::Date               as_of = util::Today();

  static OrchestratorOptions FromConfig(const fraudit::config::RuntimeConfig& config);
};

/*
  Runs detection rules on a bounded pool.

  Every rule is an independent unit: its exceptions are caught at the task
  boundary and recorded as a failed task, never propagated. The payment
  graph is built once per run and shared read-only. Alerts are created
  inside the task through the idempotent alert engine.

  Cancellation is checked before each rule is dispatched; rules already
  running finish and commit, rules never started stay pending.
*/
class Orchestrator {
 public:
  Orchestrator(RuleRegistry registry, std::shared_ptr<const db::DatasetReader> dataset,
               std::shared_ptr<relationships::RelationshipStore> relationships, std::shared_ptr<alerts::AlertEngine> alerts,
               match::MatchingEngine matcher, config::Thresholds thresholds, OrchestratorOptions options);

  RunSummary RunAll(const work::CancellationToken* cancel = nullptr) const;

  // Canonical name or CLI alias. Unknown names yield a summary with one failed task.
  RunSummary RunRule(std::string_view name) const;

  const RuleRegistry& Registry() const {
    return registry_;
  }

 private:
  RunSummary Run(const std::vector<std::shared_ptr<const DetectionRule>>& rules, const work::CancellationToken* cancel) const;
  std::size_t Execute(const DetectionRule& rule, const RuleContext& context, DetectionTask& task) const;

  RuleRegistry                                      registry_;
  std::shared_ptr<const db::DatasetReader>          dataset_;
  std::shared_ptr<relationships::RelationshipStore> relationships_;
  std::shared_ptr<alerts::AlertEngine>              alerts_;
  match::MatchingEngine                             matcher_;
  config::Thresholds                                thresholds_;
  OrchestratorOptions                               options_;
};

} // namespace fraudit::detection
