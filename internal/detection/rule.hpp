#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "internal/alerts/alert_engine.hpp"
#include "internal/config/thresholds.hpp"
#include "internal/db/api/dataset_reader.hpp"
#include "internal/graph/payment_graph.hpp"
#include "internal/match/matching_engine.hpp"
#include "internal/relationships/relationship_store.hpp"
#include "internal/util/time.hpp"

namespace fraudit::detection {

/*
  Everything a rule may touch during one run.

  The dataset, thresholds, graph and matcher are shared read-only by every
  rule. The relationship store is the only shared mutable state and is safe
  for concurrent upserts.
*/
struct RuleContext {
  const config::Thresholds&         thresholds;
  const db::DatasetReader&          dataset;
  relationships::RelationshipStore& relationships;
  const graph::PaymentGraph&        graph;
  const match::MatchingEngine&      matcher;
  std::size_t                       max_candidates_per_item = 10;
  util::Date                        as_of;
};

/*
  One detection rule. Run produces alert requests; the orchestrator turns
  them into alerts. Rules hold no state between runs.
*/
class DetectionRule {
 public:
  virtual ~DetectionRule() = default;

  virtual std::string_view Name() const        = 0;
  virtual std::string_view DisplayName() const = 0;

  virtual std::vector<alerts::AlertRequest> Run(const RuleContext& context) const = 0;
};

} // namespace fraudit::detection
