#include "orchestrator.hpp"

#include <numeric>
#include <utility>

#include "internal/graph/payment_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/work/work_pool.hpp"

namespace fraudit::detection {

using fraudit::observability::DoubleField;
using fraudit::observability::IntField;
using fraudit::observability::StringField;

namespace {

constexpr std::size_t kSummaryErrorLength = 120;

void Tally(RunSummary& summary) {
  for (const auto& task : summary.tasks) {
    switch (task.status) {
      case TaskStatus::kSuccess:
        ++summary.succeeded;
        summary.total_alerts += task.alert_count;
        break;
      case TaskStatus::kFailed:
        ++summary.failed;
        break;
      case TaskStatus::kPending:
      case TaskStatus::kRunning:
        ++summary.cancelled;
        break;
    }
  }
}

void Fail(DetectionTask& task, const std::string& error) {
  FRAUDIT_LOG_ERROR("rule failed", {StringField("rule", task.rule_name), StringField("error", error)});
  task.status = TaskStatus::kFailed;
  task.error  = util::Truncate(error, kSummaryErrorLength);
}

} // namespace

OrchestratorOptions OrchestratorOptions::FromConfig(const fraudit::config::RuntimeConfig& config) {
  OrchestratorOptions options;
  if (config.detection().max_workers() > 0) {
    options.max_workers = config.detection().max_workers();
  }
  if (config.matching().max_candidates_per_item() > 0) {
    options.max_candidates_per_item = config.matching().max_candidates_per_item();
  }
  options.enabled_rules.assign(config.detection().rules().begin(), config.detection().rules().end());
  if (!config.detection().as_of().empty()) {
    auto as_of = util::ParseDate(config.detection().as_of());
    if (!as_of) {
      throw util::ValidationError("detection.as_of must be YYYY-MM-DD: " + config.detection().as_of());
    }
    options.as_of = *as_of;
  }
  return options;
}

Orchestrator::Orchestrator(RuleRegistry registry, std::shared_ptr<const db::DatasetReader> dataset,
                           std::shared_ptr<relationships::RelationshipStore> relationships, std::shared_ptr<alerts::AlertEngine> alerts,
                           match::MatchingEngine matcher, config::Thresholds thresholds, OrchestratorOptions options)
    : registry_(std::move(registry)),
      dataset_(std::move(dataset)),
      relationships_(std::move(relationships)),
      alerts_(std::move(alerts)),
      matcher_(std::move(matcher)),
      thresholds_(std::move(thresholds)),
      options_(std::move(options)) {
}

RunSummary Orchestrator::RunAll(const work::CancellationToken* cancel) const {
  if (options_.enabled_rules.empty()) {
    return Run(registry_.Rules(), cancel);
  }

  std::vector<std::string> known;
  std::vector<std::string> unknown;
  for (const auto& name : options_.enabled_rules) {
    (registry_.Find(name) ? known : unknown).push_back(name);
  }

  auto summary = Run(registry_.Subset(known).Rules(), cancel);

  // unknown names are reported after the registered rules
  for (const auto& name : unknown) {
    DetectionTask task;
    task.rule_name = name;
    Fail(task, "unknown rule: " + name);
    summary.tasks.push_back(std::move(task));
    ++summary.failed;
  }
  return summary;
}

RunSummary Orchestrator::RunRule(std::string_view name) const {
  auto rule = registry_.Find(name);
  if (!rule) {
    RunSummary    summary;
    DetectionTask task;
    task.rule_name = std::string(name);
    Fail(task, "unknown rule: " + std::string(name));
    summary.tasks.push_back(std::move(task));
    Tally(summary);
    return summary;
  }
  return Run({rule}, nullptr);
}

std::size_t Orchestrator::Execute(const DetectionRule& rule, const RuleContext& context, DetectionTask& task) const {
  task.status     = TaskStatus::kRunning;
  task.started_at = util::Now();
  FRAUDIT_LOG_INFO("rule started", {StringField("rule", task.rule_name)});

  try {
    auto requests = rule.Run(context);

    std::size_t created = 0;
    for (const auto& request : requests) {
      try {
        if (alerts_->Create(request).Created()) {
          ++created;
        }
      } catch (const util::ValidationError& e) {
        FRAUDIT_LOG_WARN("alert request skipped", {StringField("rule", task.rule_name), StringField("error", e.what())});
      }
    }

    task.finished_at = util::Now();
    task.alert_count = created;
    FRAUDIT_LOG_INFO("rule finished", {StringField("rule", task.rule_name), IntField("alerts", static_cast<std::int64_t>(created)),
                                       IntField("requests", static_cast<std::int64_t>(requests.size())),
                                       DoubleField("seconds", task.Seconds())});
    return created;
  } catch (...) {
    task.finished_at = util::Now();
    throw;
  }
}

RunSummary Orchestrator::Run(const std::vector<std::shared_ptr<const DetectionRule>>& rules, const work::CancellationToken* cancel) const {
  RunSummary summary;
  summary.tasks.resize(rules.size());
  for (std::size_t i = 0; i < rules.size(); ++i) {
    summary.tasks[i].rule_name = std::string(rules[i]->Name());
  }

  FRAUDIT_LOG_INFO("detection run started", {IntField("rules", static_cast<std::int64_t>(rules.size())),
                                             IntField("workers", static_cast<std::int64_t>(options_.max_workers)),
                                             StringField("as_of", util::FormatDate(options_.as_of))});

  graph::PaymentGraph graph;
  try {
    graph = graph::PaymentGraph::Build(dataset_->AggregateVendorAgency(), relationships_->QueryAll());
  } catch (const std::exception& e) {
    for (auto& task : summary.tasks) {
      Fail(task, std::string("graph build failed: ") + e.what());
    }
    Tally(summary);
    return summary;
  }
  FRAUDIT_LOG_INFO("payment graph built", {IntField("nodes", static_cast<std::int64_t>(graph.NodeCount())),
                                           IntField("edges", static_cast<std::int64_t>(graph.EdgeCount()))});

  const RuleContext context{thresholds_, *dataset_, *relationships_, graph, matcher_, options_.max_candidates_per_item, options_.as_of};

  std::vector<std::size_t> units(rules.size());
  std::iota(units.begin(), units.end(), std::size_t{0});

  auto results = work::RunPool(
      units, [&](std::size_t index) { return Execute(*rules[index], context, summary.tasks[index]); }, options_.max_workers, cancel);

  for (std::size_t i = 0; i < results.size(); ++i) {
    auto& task   = summary.tasks[i];
    auto& result = results[i];
    if (!result.started) {
      continue;
    }
    if (result.Succeeded()) {
      task.status = TaskStatus::kSuccess;
    } else {
      Fail(task, result.error);
    }
  }

  Tally(summary);
  FRAUDIT_LOG_INFO("detection run finished", {IntField("alerts", static_cast<std::int64_t>(summary.total_alerts)),
                                              IntField("succeeded", static_cast<std::int64_t>(summary.succeeded)),
                                              IntField("failed", static_cast<std::int64_t>(summary.failed)),
                                              IntField("cancelled", static_cast<std::int64_t>(summary.cancelled))});
  return summary;
}

} // namespace fraudit::detection
