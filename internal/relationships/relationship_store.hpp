#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/relationship.hpp"

namespace fraudit::relationships {

struct UpsertSummary {
  std::size_t inserted  = 0;
  std::size_t updated   = 0;
  std::size_t unchanged = 0;
};

/*
  Merged, deduplicated relationship edges.

  Edges are canonicalized before they reach storage. Each upsert is a
  compare-and-update inside one write transaction, and the repository
  serializes writers, so concurrent callers cannot lower a stored confidence
  or create a second row. Queries use read transactions. Safe to call from
  any thread.
*/
class RelationshipStore {
 public:
  explicit RelationshipStore(std::shared_ptr<db::Repository> repository);

  // Throws util::ValidationError for malformed edges.
  model::UpsertOutcome Upsert(const model::RelationshipEdge& edge);

  // One transaction for the whole batch; edges are applied in order.
  UpsertSummary UpsertAll(const std::vector<model::RelationshipEdge>& edges);

  // Every edge touching the entity, in either position.
  std::vector<model::RelationshipEdge> QueryRelated(model::EntityKind kind, model::EntityId id) const;

  std::vector<model::RelationshipEdge> QueryPairs(const std::string& relation_type) const;

  std::vector<model::RelationshipEdge> QueryAll() const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace fraudit::relationships
