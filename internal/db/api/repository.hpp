#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/alert.hpp"
#include "internal/model/relationship.hpp"

namespace fraudit::db {

/*
  Repository abstraction for the rows this system owns.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - One relationship row per canonical (kind_1, id_1, kind_2, id_2, relation_type);
    its confidence never decreases
  - At most one open alert per (alert_type, entity_kind, entity_id)

  Callers pass edges already in canonical order (model::Canonicalize).
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // For lookups only; write calls through it fail. Backends may let
  // several read transactions run at once.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Relationships
  // ---------------------------------------------------------------------

  // Inserts, or replaces confidence and evidence only when the new
  // confidence is strictly greater.
  virtual Result UpsertRelationship(Transaction&, const model::RelationshipEdge& edge, model::UpsertOutcome& outcome) = 0;

  virtual std::vector<model::RelationshipEdge> ListRelationshipsFor(Transaction&, model::EntityKind kind, model::EntityId id) = 0;

  virtual std::vector<model::RelationshipEdge> ListRelationshipsByType(Transaction&, const std::string& relation_type) = 0;

  virtual std::vector<model::RelationshipEdge> ListRelationships(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Alerts
  // ---------------------------------------------------------------------

  virtual std::optional<model::Alert> FindOpenAlert(Transaction&, const std::string& alert_type, model::EntityKind kind,
                                                    model::EntityId id) = 0;

  // Assigns alert.id. AlreadyExists when an open alert with the same key exists.
  virtual Result InsertAlert(Transaction&, model::Alert& alert) = 0;

  virtual Result UpdateAlertStatus(Transaction&, model::AlertId id, model::AlertStatus status, std::uint64_t updated_at_ms) = 0;

  virtual std::optional<model::Alert> GetAlert(Transaction&, model::AlertId id) = 0;

  virtual std::vector<model::Alert> ListAlerts(Transaction&) = 0;
};

} // namespace fraudit::db
