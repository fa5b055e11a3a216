#include "matching_engine.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <utility>

#include "internal/match/blocking_index.hpp"
#include "internal/match/similarity.hpp"
#include "internal/observability/logging.hpp"
#include "internal/work/work_pool.hpp"

namespace fraudit::match {

using fraudit::observability::IntField;
using fraudit::observability::StringField;

namespace {

using EntityRefs = std::vector<const model::CanonicalEntity*>;

struct Scored {
  const model::CanonicalEntity* partner = nullptr;
  double                        score   = 0.0;
};

EntityRefs Usable(const std::vector<model::CanonicalEntity>& entities, std::size_t* skipped) {
  EntityRefs refs;
  refs.reserve(entities.size());
  for (const auto& entity : entities) {
    if (!entity.normalized_name || entity.normalized_name->empty()) {
      ++*skipped;
      continue;
    }
    refs.push_back(&entity);
  }
  std::sort(refs.begin(), refs.end(), [](const auto* a, const auto* b) { return a->id < b->id; });
  return refs;
}

// Best partners of one item, score descending then id ascending.
std::vector<Scored> BestPartners(const model::CanonicalEntity& item, const BlockingIndex& index, bool self_mode, double threshold,
                                 std::size_t limit) {
  std::vector<Scored> scored;
  for (auto position : index.Candidates(*item.normalized_name)) {
    const auto& partner = index.At(position);
    if (self_mode && partner.id == item.id) {
      continue;
    }

    const auto& a = *item.normalized_name;
    const auto& b = *partner.normalized_name;
    if (a == b) {
      scored.push_back({&partner, 1.0});
      continue;
    }
    if (auto score = SimilarityAtLeast(a, b, threshold)) {
      scored.push_back({&partner, *score});
    }
  }

  std::sort(scored.begin(), scored.end(), [](const Scored& x, const Scored& y) {
    if (x.score != y.score) return x.score > y.score;
    return x.partner->id < y.partner->id;
  });
  if (scored.size() > limit) {
    scored.resize(limit);
  }
  return scored;
}

} // namespace

MatchingOptions MatchingOptions::FromConfig(const fraudit::config::MatchingConfig& config) {
  MatchingOptions options;
  if (config.batch_size() > 0) options.batch_size = config.batch_size();
  if (config.max_workers() > 0) options.max_workers = config.max_workers();
  if (config.max_block_size() > 0) options.max_block_size = config.max_block_size();
  if (config.blocking_prefix_length() > 0) options.blocking_prefix_length = config.blocking_prefix_length();
  return options;
}

MatchingEngine::MatchingEngine(MatchingOptions options) : options_(options) {
}

MatchReport MatchingEngine::Match(const std::vector<model::CanonicalEntity>& entities, const std::vector<model::CanonicalEntity>* reference,
                                  double threshold, std::size_t max_candidates_per_item) const {
  MatchReport report;
  if (max_candidates_per_item == 0) {
    return report;
  }

  const bool self_mode = reference == nullptr;
  EntityRefs left      = Usable(entities, &report.skipped_entities);
  EntityRefs right     = self_mode ? left : Usable(*reference, &report.skipped_entities);

  // query the larger side against an index of the smaller one
  const bool  swap_sides = !self_mode && left.size() > right.size();
  const auto& queried    = swap_sides ? left : right;
  const auto& indexed    = swap_sides ? right : left;

  // the cap belongs to entities items; when reference items are queried it is applied after the merge
  const bool        cap_while_querying = self_mode || swap_sides;
  const std::size_t query_limit        = cap_while_querying ? max_candidates_per_item : std::numeric_limits<std::size_t>::max();

  BlockingIndex index(indexed, options_.blocking_prefix_length, options_.max_block_size);
  report.truncated_blocks = index.TruncatedBlocks();

  auto batches = work::Partition(queried, options_.batch_size);
  auto results = work::RunPool(
      batches,
      [&](const std::span<const model::CanonicalEntity* const>& batch) {
        std::vector<CandidatePair> out;
        for (const auto* item : batch) {
          for (const auto& match : BestPartners(*item, index, self_mode, threshold, query_limit)) {
            CandidatePair pair;
            pair.score = match.score;
            if (self_mode) {
              pair.id_1 = std::min(item->id, match.partner->id);
              pair.id_2 = std::max(item->id, match.partner->id);
            } else if (swap_sides) {
              pair.id_1 = item->id;
              pair.id_2 = match.partner->id;
            } else {
              pair.id_1 = match.partner->id;
              pair.id_2 = item->id;
            }
            out.push_back(pair);
          }
        }
        return out;
      },
      options_.max_workers);

  std::map<std::pair<model::EntityId, model::EntityId>, double> merged;
  for (std::size_t i = 0; i < results.size(); ++i) {
    auto& result = results[i];
    if (!result.Succeeded()) {
      ++report.failed_batches;
      report.errors.push_back(result.error);
      FRAUDIT_LOG_ERROR("matching batch failed", {IntField("batch", static_cast<std::int64_t>(i)), StringField("error", result.error)});
      continue;
    }
    for (const auto& pair : *result.value) {
      auto [it, inserted] = merged.emplace(std::make_pair(pair.id_1, pair.id_2), pair.score);
      if (!inserted) {
        it->second = std::max(it->second, pair.score);
      }
    }
  }

  report.pairs.reserve(merged.size());
  if (self_mode) {
    for (const auto& [ids, score] : merged) {
      report.pairs.push_back({ids.first, ids.second, score});
    }
  } else {
    std::map<model::EntityId, std::vector<CandidatePair>> by_entity;
    for (const auto& [ids, score] : merged) {
      by_entity[ids.first].push_back({ids.first, ids.second, score});
    }
    for (auto& [_, pairs] : by_entity) {
      std::sort(pairs.begin(), pairs.end(), [](const CandidatePair& x, const CandidatePair& y) {
        if (x.score != y.score) return x.score > y.score;
        return x.id_2 < y.id_2;
      });
      if (pairs.size() > max_candidates_per_item) {
        pairs.resize(max_candidates_per_item);
      }
      std::sort(pairs.begin(), pairs.end(), [](const CandidatePair& x, const CandidatePair& y) { return x.id_2 < y.id_2; });
      report.pairs.insert(report.pairs.end(), pairs.begin(), pairs.end());
    }
  }

  if (report.skipped_entities > 0) {
    FRAUDIT_LOG_WARN("matching skipped entities without a normalized name",
                     {IntField("skipped", static_cast<std::int64_t>(report.skipped_entities))});
  }
  FRAUDIT_LOG_DEBUG("matching finished", {IntField("batches", static_cast<std::int64_t>(batches.size())),
                                          IntField("pairs", static_cast<std::int64_t>(report.pairs.size()))});
  return report;
}

} // namespace fraudit::match
