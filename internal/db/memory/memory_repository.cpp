#include "memory_repository.hpp"

#include "internal/model/state_machine.hpp"
#include "memory_tx.hpp"

namespace fraudit::db::memory {

MemoryRepository::EdgeKey MemoryRepository::KeyOf(const model::RelationshipEdge& edge) {
  return {edge.kind_1, edge.id_1, edge.kind_2, edge.id_2, edge.relation_type};
}

MemoryRepository::OpenKey MemoryRepository::OpenKeyOf(const model::Alert& alert) {
  return {alert.alert_type, alert.entity_kind, alert.entity_id};
}

void MemoryRepository::State::PutEdge(const model::RelationshipEdge& edge) {
  auto key = KeyOf(edge);
  edges_by_entity[{edge.kind_1, edge.id_1}].insert(key);
  edges_by_entity[{edge.kind_2, edge.id_2}].insert(key);
  edges_by_type[edge.relation_type].insert(key);
  relationships.insert_or_assign(std::move(key), edge);
}

void MemoryRepository::State::EraseEdge(const EdgeKey& key) {
  auto it = relationships.find(key);
  if (it == relationships.end()) return;

  const auto& edge = it->second;
  for (const EntityRef ref : {EntityRef{edge.kind_1, edge.id_1}, EntityRef{edge.kind_2, edge.id_2}}) {
    auto bucket = edges_by_entity.find(ref);
    if (bucket == edges_by_entity.end()) continue;
    bucket->second.erase(key);
    if (bucket->second.empty()) edges_by_entity.erase(bucket);
  }
  if (auto bucket = edges_by_type.find(edge.relation_type); bucket != edges_by_type.end()) {
    bucket->second.erase(key);
    if (bucket->second.empty()) edges_by_type.erase(bucket);
  }
  relationships.erase(it);
}

void MemoryRepository::State::PutAlert(const model::Alert& alert) {
  EraseAlert(alert.id);
  alerts.emplace(alert.id, alert);
  if (model::IsOpen(alert.status)) {
    open_alerts[OpenKeyOf(alert)] = alert.id;
  }
}

void MemoryRepository::State::EraseAlert(model::AlertId id) {
  auto it = alerts.find(id);
  if (it == alerts.end()) return;

  auto open = open_alerts.find(OpenKeyOf(it->second));
  if (open != open_alerts.end() && open->second == id) {
    open_alerts.erase(open);
  }
  alerts.erase(it);
}

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::UpsertRelationship(Transaction& t, const model::RelationshipEdge& edge, model::UpsertOutcome& outcome) {
  auto& tx  = TX(t);
  auto& s   = tx.Mutable();
  auto  key = KeyOf(edge);

  auto it = s.relationships.find(key);
  if (it == s.relationships.end()) {
    s.PutEdge(edge);
    tx.OnRollback([key](State& state) { state.EraseEdge(key); });
    outcome = model::UpsertOutcome::kInserted;
    return Result::Ok();
  }

  if (edge.confidence > it->second.confidence) {
    auto updated       = it->second;
    updated.confidence = edge.confidence;
    updated.evidence   = edge.evidence;
    tx.OnRollback([previous = it->second](State& state) { state.PutEdge(previous); });
    s.PutEdge(updated);
    outcome = model::UpsertOutcome::kUpdated;
    return Result::Ok();
  }

  outcome = model::UpsertOutcome::kUnchanged;
  return Result::Ok();
}

std::vector<model::RelationshipEdge> MemoryRepository::ListRelationshipsFor(Transaction& t, model::EntityKind kind, model::EntityId id) {
  const auto&                          s = TX(t).View();
  std::vector<model::RelationshipEdge> out;

  auto bucket = s.edges_by_entity.find({kind, id});
  if (bucket == s.edges_by_entity.end()) return out;

  out.reserve(bucket->second.size());
  for (const auto& key : bucket->second) {
    out.push_back(s.relationships.at(key));
  }
  return out;
}

std::vector<model::RelationshipEdge> MemoryRepository::ListRelationshipsByType(Transaction& t, const std::string& relation_type) {
  const auto&                          s = TX(t).View();
  std::vector<model::RelationshipEdge> out;

  auto bucket = s.edges_by_type.find(relation_type);
  if (bucket == s.edges_by_type.end()) return out;

  out.reserve(bucket->second.size());
  for (const auto& key : bucket->second) {
    out.push_back(s.relationships.at(key));
  }
  return out;
}

std::vector<model::RelationshipEdge> MemoryRepository::ListRelationships(Transaction& t) {
  const auto&                          s = TX(t).View();
  std::vector<model::RelationshipEdge> out;
  out.reserve(s.relationships.size());
  for (const auto& [_, edge] : s.relationships) {
    out.push_back(edge);
  }
  return out;
}

std::optional<model::Alert> MemoryRepository::FindOpenAlert(Transaction& t, const std::string& alert_type, model::EntityKind kind,
                                                            model::EntityId id) {
  const auto& s    = TX(t).View();
  auto        open = s.open_alerts.find({alert_type, kind, id});
  if (open == s.open_alerts.end()) return std::nullopt;
  return s.alerts.at(open->second);
}

Result MemoryRepository::InsertAlert(Transaction& t, model::Alert& alert) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  if (model::IsOpen(alert.status) && s.open_alerts.contains(OpenKeyOf(alert))) {
    return Result::Err(ErrorCode::AlreadyExists, "open alert exists for " + alert.alert_type);
  }

  const auto previous_next = s.next_alert_id;
  alert.id                 = s.next_alert_id++;
  s.PutAlert(alert);
  tx.OnRollback([id = alert.id, previous_next](State& state) {
    state.EraseAlert(id);
    state.next_alert_id = previous_next;
  });
  return Result::Ok();
}

Result MemoryRepository::UpdateAlertStatus(Transaction& t, model::AlertId id, model::AlertStatus status, std::uint64_t updated_at_ms) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  auto  it = s.alerts.find(id);
  if (it == s.alerts.end()) return Result::Err(ErrorCode::NotFound, "alert " + std::to_string(id));

  const auto previous = it->second;
  // reopening would collide with another open alert for the same key
  if (model::IsOpen(status) && !model::IsOpen(previous.status)) {
    auto open = s.open_alerts.find(OpenKeyOf(previous));
    if (open != s.open_alerts.end() && open->second != id) {
      return Result::Err(ErrorCode::ConstraintViolation, "open alert exists for " + previous.alert_type);
    }
  }

  auto updated          = previous;
  updated.status        = status;
  updated.updated_at_ms = updated_at_ms;
  s.PutAlert(updated);
  tx.OnRollback([previous](State& state) { state.PutAlert(previous); });
  return Result::Ok();
}

std::optional<model::Alert> MemoryRepository::GetAlert(Transaction& t, model::AlertId id) {
  const auto& s  = TX(t).View();
  auto        it = s.alerts.find(id);
  if (it == s.alerts.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Alert> MemoryRepository::ListAlerts(Transaction& t) {
  const auto&               s = TX(t).View();
  std::vector<model::Alert> out;
  out.reserve(s.alerts.size());
  for (const auto& [_, alert] : s.alerts) {
    out.push_back(alert);
  }
  return out;
}

} // namespace fraudit::db::memory
