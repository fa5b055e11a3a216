#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/entity.hpp"

namespace fraudit::match {

struct CandidatePair {
  model::EntityId id_1  = 0;
  model::EntityId id_2  = 0;
  double          score = 0.0;
};

struct MatchingOptions {
  std::size_t batch_size             = 1000;
  std::size_t max_workers            = 4;
  std::size_t max_block_size         = 5000;
  std::size_t blocking_prefix_length = 3;

  static MatchingOptions FromConfig(const fraudit::config::MatchingConfig& config);
};

struct MatchReport {
  // sorted by (id_1, id_2)
  std::vector<CandidatePair> pairs;
  std::size_t                skipped_entities = 0;
  std::size_t                failed_batches   = 0;
  std::size_t                truncated_blocks = 0;
  std::vector<std::string>   errors;
};

/*
  Blocked fuzzy matcher.

  Self mode (no reference): pairs within entities, each emitted once with
  id_1 < id_2; every item keeps at most max_candidates_per_item partners.
  Cross mode: id_1 always comes from entities and id_2 from reference, and
  each entities item keeps at most max_candidates_per_item reference
  partners. The larger side is queried in batches against a blocking index
  of the smaller side. Partners score at or above threshold and are ranked
  best score first, lower id on ties.

  Batches run on a bounded pool and share only immutable inputs, so the
  output does not depend on worker count or batch size. Entities without a
  normalized name are skipped and counted.
*/
class MatchingEngine {
 public:
  explicit MatchingEngine(MatchingOptions options);

  MatchReport Match(const std::vector<model::CanonicalEntity>& entities, const std::vector<model::CanonicalEntity>* reference,
                    double threshold, std::size_t max_candidates_per_item) const;

  const MatchingOptions& Options() const {
    return options_;
  }

 private:
  MatchingOptions options_;
};

} // namespace fraudit::match
