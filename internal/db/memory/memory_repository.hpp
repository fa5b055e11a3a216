#pragma once

#include <functional>
#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace fraudit::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
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
  friend class MemoryTransaction;

  using EdgeKey   = std::tuple<model::EntityKind, model::EntityId, model::EntityKind, model::EntityId, std::string>;
  using EntityRef = std::pair<model::EntityKind, model::EntityId>;
  using OpenKey   = std::tuple<std::string, model::EntityKind, model::EntityId>;

  /*
    Tables plus the secondary indexes kept in step with them. All changes go
    through the Put/Erase helpers so the indexes never drift.
  */
  struct State {
    std::map<EdgeKey, model::RelationshipEdge> relationships;
    std::map<EntityRef, std::set<EdgeKey>>     edges_by_entity;
    std::map<std::string, std::set<EdgeKey>>   edges_by_type;
    std::map<model::AlertId, model::Alert>     alerts;
    std::map<OpenKey, model::AlertId>          open_alerts;
    model::AlertId                             next_alert_id = 1;

    void PutEdge(const model::RelationshipEdge& edge);
    void EraseEdge(const EdgeKey& key);
    void PutAlert(const model::Alert& alert);
    void EraseAlert(model::AlertId id);
  };

  using Undo = std::function<void(State&)>;

  static EdgeKey KeyOf(const model::RelationshipEdge& edge);
  static OpenKey OpenKeyOf(const model::Alert& alert);

  // writers hold it exclusively for the whole transaction, readers shared
  std::shared_mutex mutex_;
  State             state_;
};

} // namespace fraudit::db::memory
