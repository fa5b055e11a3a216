#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/memory/memory_dataset.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/detection/orchestrator.hpp"

namespace {

using fraudit::alerts::AlertEngine;
using fraudit::alerts::AlertRequest;
using fraudit::detection::DetectionRule;
using fraudit::detection::Orchestrator;
using fraudit::detection::OrchestratorOptions;
using fraudit::detection::RuleContext;
using fraudit::detection::RuleRegistry;
using fraudit::detection::TaskStatus;
using fraudit::relationships::RelationshipStore;

// Emits `count` alerts on vendors base+1..base+count, or throws.
class StubRule final : public DetectionRule {
 public:
  StubRule(std::string name, std::uint64_t base, std::size_t count, bool fail = false, bool invalid_extra = false)
      : name_(std::move(name)), base_(base), count_(count), fail_(fail), invalid_extra_(invalid_extra) {
  }

  std::string_view Name() const override {
    return name_;
  }
  std::string_view DisplayName() const override {
    return name_;
  }

  std::vector<AlertRequest> Run(const RuleContext&) const override {
    if (fail_) {
      throw std::runtime_error(name_ + " blew up: " + std::string(200, 'x'));
    }

    std::vector<AlertRequest> requests;
    for (std::size_t i = 1; i <= count_; ++i) {
      AlertRequest request;
      request.alert_type = name_;
      request.title      = name_ + " finding";
      request.entity_id  = base_ + i;
      requests.push_back(request);
    }
    if (invalid_extra_) {
      // no entity: rejected by the alert engine, the rule still succeeds
      AlertRequest request;
      request.alert_type = name_;
      request.title      = "invalid";
      requests.push_back(request);
    }
    return requests;
  }

 private:
  std::string   name_;
  std::uint64_t base_;
  std::size_t   count_;
  bool          fail_;
  bool          invalid_extra_;
};

// Throws a value that is not a std::exception.
class OddThrowRule final : public DetectionRule {
 public:
  std::string_view Name() const override {
    return "odd_throw";
  }
  std::string_view DisplayName() const override {
    return "odd_throw";
  }
  std::vector<AlertRequest> Run(const RuleContext&) const override {
    throw 42;
  }
};

class BrokenDataset final : public fraudit::db::DatasetReader {
 public:
  std::vector<fraudit::model::CanonicalEntity> ListEntities(fraudit::model::EntityKind) const override {
    return {};
  }
  std::optional<fraudit::model::CanonicalEntity> FindEntity(fraudit::model::EntityKind, fraudit::model::EntityId) const override {
    return std::nullopt;
  }
  std::vector<fraudit::model::PaymentRecord> ListPayments() const override {
    return {};
  }
  std::vector<fraudit::model::ContractRecord> ListContracts() const override {
    return {};
  }
  std::vector<fraudit::model::VendorAgencyAggregate> AggregateVendorAgency() const override {
    throw std::runtime_error("dataset unavailable");
  }
};

RuleRegistry FiveRules() {
  RuleRegistry registry;
  registry.Add(std::make_shared<StubRule>("rule_one", 100, 2));
  registry.Add(std::make_shared<StubRule>("rule_two", 200, 3));
  registry.Add(std::make_shared<StubRule>("rule_three", 300, 4, true));
  registry.Add(std::make_shared<StubRule>("rule_four", 400, 1, false, true));
  registry.Add(std::make_shared<StubRule>("rule_five", 500, 0));
  return registry;
}

Orchestrator MakeOrchestrator(RuleRegistry registry, std::shared_ptr<const fraudit::db::DatasetReader> dataset,
                              std::shared_ptr<AlertEngine>* alerts_out = nullptr, std::size_t workers = 3) {
  auto repository    = std::make_shared<fraudit::db::memory::MemoryRepository>();
  auto relationships = std::make_shared<RelationshipStore>(repository);
  auto alerts        = std::make_shared<AlertEngine>(repository);
  if (alerts_out) {
    *alerts_out = alerts;
  }

  OrchestratorOptions options;
  options.max_workers = workers;
  return Orchestrator(std::move(registry), std::move(dataset), relationships, alerts,
                      fraudit::match::MatchingEngine(fraudit::match::MatchingOptions{}), fraudit::config::Thresholds{}, options);
}

void TestPartialFailureIsIsolated() {
  std::shared_ptr<AlertEngine> alerts;
  auto orchestrator = MakeOrchestrator(FiveRules(), std::make_shared<fraudit::db::memory::MemoryDataset>(), &alerts);

  auto summary = orchestrator.RunAll();
  assert(summary.failed == 1);
  assert(summary.succeeded == 4);
  assert(summary.cancelled == 0);
  assert(summary.total_alerts == 2 + 3 + 1 + 0);
  assert(alerts->List().size() == 6);

  // registry order is kept
  assert(summary.tasks.size() == 5);
  assert(summary.tasks[0].rule_name == "rule_one");
  assert(summary.tasks[2].rule_name == "rule_three");
  assert(summary.tasks[2].status == TaskStatus::kFailed);
  assert(summary.tasks[2].error.size() == 120);
  assert(summary.tasks[2].error.find("rule_three blew up") == 0);
  assert(summary.tasks[2].started_at.has_value());
  assert(summary.tasks[2].finished_at.has_value());
  assert(summary.tasks[3].status == TaskStatus::kSuccess);
  assert(summary.tasks[3].alert_count == 1);

  // second run: everything is a duplicate
  auto rerun = orchestrator.RunAll();
  assert(rerun.failed == 1);
  assert(rerun.total_alerts == 0);
  assert(alerts->List().size() == 6);
}

void TestRunRuleByName() {
  auto orchestrator = MakeOrchestrator(FiveRules(), std::make_shared<fraudit::db::memory::MemoryDataset>());

  auto one = orchestrator.RunRule("rule_two");
  assert(one.tasks.size() == 1);
  assert(one.succeeded == 1);
  assert(one.total_alerts == 3);

  auto unknown = orchestrator.RunRule("no_such_rule");
  assert(unknown.failed == 1);
  assert(unknown.tasks[0].status == TaskStatus::kFailed);
  assert(unknown.tasks[0].error.find("unknown rule") != std::string::npos);
}

void TestCancelledRunLeavesRulesPending() {
  auto orchestrator = MakeOrchestrator(FiveRules(), std::make_shared<fraudit::db::memory::MemoryDataset>());

  fraudit::work::CancellationToken token;
  token.Cancel();

  auto summary = orchestrator.RunAll(&token);
  assert(summary.cancelled == 5);
  assert(summary.succeeded == 0);
  assert(summary.failed == 0);
  for (const auto& task : summary.tasks) {
    assert(task.status == TaskStatus::kPending);
    assert(!task.started_at.has_value());
  }
}

void TestGraphFailureFailsEveryRule() {
  auto orchestrator = MakeOrchestrator(FiveRules(), std::make_shared<BrokenDataset>());

  auto summary = orchestrator.RunAll();
  assert(summary.failed == 5);
  assert(summary.total_alerts == 0);
  assert(summary.tasks[0].error.find("dataset unavailable") != std::string::npos);
}

void TestEnabledSubset() {
  auto repository    = std::make_shared<fraudit::db::memory::MemoryRepository>();
  auto relationships = std::make_shared<RelationshipStore>(repository);
  auto alerts        = std::make_shared<AlertEngine>(repository);

  OrchestratorOptions options;
  options.enabled_rules = {"rule_five", "rule_one"};
  Orchestrator orchestrator(FiveRules(), std::make_shared<fraudit::db::memory::MemoryDataset>(), relationships, alerts,
                            fraudit::match::MatchingEngine(fraudit::match::MatchingOptions{}), fraudit::config::Thresholds{}, options);

  auto summary = orchestrator.RunAll();
  assert(summary.tasks.size() == 2);
  assert(summary.tasks[0].rule_name == "rule_one");
  assert(summary.tasks[1].rule_name == "rule_five");
  assert(summary.total_alerts == 2);

  // a misspelled name fails its own task; the known rules still run
  options.enabled_rules = {"rule_two", "rule_tow"};
  Orchestrator misspelled(FiveRules(), std::make_shared<fraudit::db::memory::MemoryDataset>(), relationships, alerts,
                          fraudit::match::MatchingEngine(fraudit::match::MatchingOptions{}), fraudit::config::Thresholds{}, options);

  auto partial = misspelled.RunAll();
  assert(partial.tasks.size() == 2);
  assert(partial.tasks[0].rule_name == "rule_two");
  assert(partial.tasks[0].status == TaskStatus::kSuccess);
  assert(partial.tasks[1].rule_name == "rule_tow");
  assert(partial.tasks[1].status == TaskStatus::kFailed);
  assert(partial.tasks[1].error == "unknown rule: rule_tow");
  assert(partial.succeeded == 1);
  assert(partial.failed == 1);
  assert(partial.total_alerts == 3);
}

void TestNonStandardThrowFailsOnlyThatRule() {
  RuleRegistry registry;
  registry.Add(std::make_shared<StubRule>("rule_one", 100, 2));
  registry.Add(std::make_shared<OddThrowRule>());
  auto orchestrator = MakeOrchestrator(std::move(registry), std::make_shared<fraudit::db::memory::MemoryDataset>());

  auto summary = orchestrator.RunAll();
  assert(summary.succeeded == 1);
  assert(summary.failed == 1);
  assert(summary.total_alerts == 2);
  assert(summary.tasks[1].status == TaskStatus::kFailed);
  assert(summary.tasks[1].error == "unknown exception");
  assert(summary.tasks[1].finished_at.has_value());
}

void TestSingleWorkerMatchesParallelOutcome() {
  auto sequential = MakeOrchestrator(FiveRules(), std::make_shared<fraudit::db::memory::MemoryDataset>(), nullptr, 1);
  auto summary    = sequential.RunAll();
  assert(summary.succeeded == 4);
  assert(summary.total_alerts == 6);
}

} // namespace

int main() {
  TestPartialFailureIsIsolated();
  TestRunRuleByName();
  TestCancelledRunLeavesRulesPending();
  TestGraphFailureFailsEveryRule();
  TestEnabledSubset();
  TestNonStandardThrowFailsOnlyThatRule();
  TestSingleWorkerMatchesParallelOutcome();

  std::cout << "fraudit_unit_orchestrator: pass\n";
  return 0;
}
