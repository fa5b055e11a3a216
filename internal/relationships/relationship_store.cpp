#include "relationship_store.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"

namespace fraudit::relationships {

using fraudit::observability::IntField;

RelationshipStore::RelationshipStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

model::UpsertOutcome RelationshipStore::Upsert(const model::RelationshipEdge& edge) {
  const auto canonical = model::Canonicalize(edge);

  // the write transaction serializes this compare-and-update against every other writer
  auto                 tx      = repository_->Begin();
  model::UpsertOutcome outcome = model::UpsertOutcome::kUnchanged;
  db::ThrowIfDbError(repository_->UpsertRelationship(*tx, canonical, outcome), "upsert relationship");
  tx->Commit();
  return outcome;
}

UpsertSummary RelationshipStore::UpsertAll(const std::vector<model::RelationshipEdge>& edges) {
  UpsertSummary summary;
  if (edges.empty()) {
    return summary;
  }

  std::vector<model::RelationshipEdge> canonical;
  canonical.reserve(edges.size());
  for (const auto& edge : edges) {
    canonical.push_back(model::Canonicalize(edge));
  }

  auto tx = repository_->Begin();
  for (const auto& edge : canonical) {
    model::UpsertOutcome outcome = model::UpsertOutcome::kUnchanged;
    db::ThrowIfDbError(repository_->UpsertRelationship(*tx, edge, outcome), "upsert relationship");
    switch (outcome) {
      case model::UpsertOutcome::kInserted:
        ++summary.inserted;
        break;
      case model::UpsertOutcome::kUpdated:
        ++summary.updated;
        break;
      case model::UpsertOutcome::kUnchanged:
        ++summary.unchanged;
        break;
    }
  }
  tx->Commit();

  FRAUDIT_LOG_DEBUG("relationships merged", {IntField("inserted", static_cast<std::int64_t>(summary.inserted)),
                                             IntField("updated", static_cast<std::int64_t>(summary.updated)),
                                             IntField("unchanged", static_cast<std::int64_t>(summary.unchanged))});
  return summary;
}

std::vector<model::RelationshipEdge> RelationshipStore::QueryRelated(model::EntityKind kind, model::EntityId id) const {
  auto tx    = repository_->BeginRead();
  auto edges = repository_->ListRelationshipsFor(*tx, kind, id);
  tx->Commit();
  return edges;
}

std::vector<model::RelationshipEdge> RelationshipStore::QueryPairs(const std::string& relation_type) const {
  auto tx    = repository_->BeginRead();
  auto edges = repository_->ListRelationshipsByType(*tx, relation_type);
  tx->Commit();
  return edges;
}

std::vector<model::RelationshipEdge> RelationshipStore::QueryAll() const {
  auto tx    = repository_->BeginRead();
  auto edges = repository_->ListRelationships(*tx);
  tx->Commit();
  return edges;
}

} // namespace fraudit::relationships
