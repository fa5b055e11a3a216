#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace fraudit::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  // One connection: reads take the same writer lock as Begin().
  std::unique_ptr<Transaction> BeginRead() override;

  Result UpsertRelationship(Transaction&, const model::RelationshipEdge& edge, model::UpsertOutcome& outcome) override;
  std::vector<model::RelationshipEdge> ListRelationshipsFor(Transaction&, model::EntityKind kind, model::EntityId id) override;
  std::vector<model::RelationshipEdge> ListRelationshipsByType(Transaction&, const std::string& relation_type) override;
  std::vector<model::RelationshipEdge> ListRelationships(Transaction&) override;

  std::optional<model::Alert> FindOpenAlert(Transaction&, const std::string& alert_type, model::EntityKind kind,
                                            model::EntityId id) override;
  Result InsertAlert(Transaction&, model::Alert& alert) override;
  Result UpdateAlertStatus(Transaction&, model::AlertId id, model::AlertStatus status, std::uint64_t updated_at_ms) override;
  std::optional<model::Alert> GetAlert(Transaction&, model::AlertId id) override;
  std::vector<model::Alert> ListAlerts(Transaction&) override;

 private:
  static SqliteTransaction& TX(Transaction& t);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace fraudit::db::sqlite
