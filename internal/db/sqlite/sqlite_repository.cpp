#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"
#include "sqlite_row.hpp"

namespace fraudit::db::sqlite {

namespace {

constexpr const char* kRelationshipColumns = "kind_1,id_1,kind_2,id_2,relation_type,confidence,evidence";

constexpr const char* kAlertColumns =
    "id,alert_type,severity,title,description,entity_kind,entity_id,evidence,status,created_at_ms,updated_at_ms";

// open = new, acknowledged, investigating
constexpr const char* kOpenStatuses = "(1,2,3)";

model::RelationshipEdge ReadEdge(sqlite3_stmt* st) {
  model::RelationshipEdge edge;
  edge.kind_1        = static_cast<model::EntityKind>(ColI32(st, 0));
  edge.id_1          = ColU64(st, 1);
  edge.kind_2        = static_cast<model::EntityKind>(ColI32(st, 2));
  edge.id_2          = ColU64(st, 3);
  edge.relation_type = ColText(st, 4);
  edge.confidence    = ColDouble(st, 5);
  edge.evidence      = ColText(st, 6);
  return edge;
}

model::Alert ReadAlert(sqlite3_stmt* st) {
  model::Alert alert;
  alert.id            = ColU64(st, 0);
  alert.alert_type    = ColText(st, 1);
  alert.severity      = static_cast<model::Severity>(ColI32(st, 2));
  alert.title         = ColText(st, 3);
  alert.description   = ColText(st, 4);
  alert.entity_kind   = static_cast<model::EntityKind>(ColI32(st, 5));
  alert.entity_id     = ColU64(st, 6);
  alert.evidence      = ColText(st, 7);
  alert.status        = static_cast<model::AlertStatus>(ColI32(st, 8));
  alert.created_at_ms = ColU64(st, 9);
  alert.updated_at_ms = ColU64(st, 10);
  return alert;
}

template <typename Row, typename ReadFn>
std::vector<Row> Collect(sqlite3_stmt* st, ReadFn read) {
  std::vector<Row> out;
  int              rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(sqlite3_db_handle(st)));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return Begin();
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Relationships
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRelationship(Transaction& t, const model::RelationshipEdge& edge, model::UpsertOutcome& outcome) {
  auto& tx = TX(t);
  auto* db = tx.Handle();

  std::optional<double> existing;
  {
    auto st = tx.DB().Prepare(
        "SELECT confidence FROM relationships WHERE kind_1=? AND id_1=? AND kind_2=? AND id_2=? AND relation_type=?;");
    BindI32(st.get(), 1, static_cast<int>(edge.kind_1));
    BindU64(st.get(), 2, edge.id_1);
    BindI32(st.get(), 3, static_cast<int>(edge.kind_2));
    BindU64(st.get(), 4, edge.id_2);
    BindText(st.get(), 5, edge.relation_type);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) {
      existing = ColDouble(st.get(), 0);
    } else if (rc != SQLITE_DONE) {
      return Translate(db, rc);
    }
  }

  // compare-and-update: the row only changes when confidence grows
  auto st = tx.DB().Prepare(
      "INSERT INTO relationships(kind_1,id_1,kind_2,id_2,relation_type,confidence,evidence,created_at_ms,updated_at_ms)"
      " VALUES(?,?,?,?,?,?,?,?,?)"
      " ON CONFLICT(kind_1,id_1,kind_2,id_2,relation_type) DO UPDATE SET"
      " confidence=excluded.confidence,"
      " evidence=excluded.evidence,"
      " updated_at_ms=excluded.updated_at_ms"
      " WHERE excluded.confidence > relationships.confidence;");

  const auto now_ms = util::ToUnixMillis(util::Now());
  BindI32(st.get(), 1, static_cast<int>(edge.kind_1));
  BindU64(st.get(), 2, edge.id_1);
  BindI32(st.get(), 3, static_cast<int>(edge.kind_2));
  BindU64(st.get(), 4, edge.id_2);
  BindText(st.get(), 5, edge.relation_type);
  BindDouble(st.get(), 6, edge.confidence);
  BindText(st.get(), 7, edge.evidence.empty() ? "{}" : edge.evidence);
  BindU64(st.get(), 8, now_ms);
  BindU64(st.get(), 9, now_ms);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    return Translate(db, rc);
  }

  if (!existing) {
    outcome = model::UpsertOutcome::kInserted;
  } else if (sqlite3_changes(db) > 0) {
    outcome = model::UpsertOutcome::kUpdated;
  } else {
    outcome = model::UpsertOutcome::kUnchanged;
  }
  return Result::Ok();
}

std::vector<model::RelationshipEdge> SqliteRepository::ListRelationshipsFor(Transaction& t, model::EntityKind kind, model::EntityId id) {
  auto st = TX(t).DB().Prepare(std::string("SELECT ") + kRelationshipColumns +
                               " FROM relationships WHERE (kind_1=?1 AND id_1=?2) OR (kind_2=?1 AND id_2=?2)"
                               " ORDER BY kind_1,id_1,kind_2,id_2,relation_type;");
  BindI32(st.get(), 1, static_cast<int>(kind));
  BindU64(st.get(), 2, id);
  return Collect<model::RelationshipEdge>(st.get(), ReadEdge);
}

std::vector<model::RelationshipEdge> SqliteRepository::ListRelationshipsByType(Transaction& t, const std::string& relation_type) {
  auto st = TX(t).DB().Prepare(std::string("SELECT ") + kRelationshipColumns +
                               " FROM relationships WHERE relation_type=? ORDER BY kind_1,id_1,kind_2,id_2,relation_type;");
  BindText(st.get(), 1, relation_type);
  return Collect<model::RelationshipEdge>(st.get(), ReadEdge);
}

std::vector<model::RelationshipEdge> SqliteRepository::ListRelationships(Transaction& t) {
  auto st = TX(t).DB().Prepare(std::string("SELECT ") + kRelationshipColumns +
                               " FROM relationships ORDER BY kind_1,id_1,kind_2,id_2,relation_type;");
  return Collect<model::RelationshipEdge>(st.get(), ReadEdge);
}

// ------------------------------------------------------------------
// Alerts
// ------------------------------------------------------------------

std::optional<model::Alert> SqliteRepository::FindOpenAlert(Transaction& t, const std::string& alert_type, model::EntityKind kind,
                                                            model::EntityId id) {
  auto st = TX(t).DB().Prepare(std::string("SELECT ") + kAlertColumns +
                               " FROM alerts WHERE alert_type=? AND entity_kind=? AND entity_id=? AND status IN " + kOpenStatuses +
                               " LIMIT 1;");
  BindText(st.get(), 1, alert_type);
  BindI32(st.get(), 2, static_cast<int>(kind));
  BindU64(st.get(), 3, id);

  auto rows = Collect<model::Alert>(st.get(), ReadAlert);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

Result SqliteRepository::InsertAlert(Transaction& t, model::Alert& alert) {
  auto& tx = TX(t);
  auto* db = tx.Handle();

  auto st = tx.DB().Prepare(
      "INSERT INTO alerts(alert_type,severity,title,description,entity_kind,entity_id,evidence,status,created_at_ms,updated_at_ms)"
      " VALUES(?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, alert.alert_type);
  BindI32(st.get(), 2, static_cast<int>(alert.severity));
  BindText(st.get(), 3, alert.title);
  BindText(st.get(), 4, alert.description);
  BindI32(st.get(), 5, static_cast<int>(alert.entity_kind));
  BindU64(st.get(), 6, alert.entity_id);
  BindText(st.get(), 7, alert.evidence.empty() ? "{}" : alert.evidence);
  BindI32(st.get(), 8, static_cast<int>(alert.status));
  BindU64(st.get(), 9, alert.created_at_ms);
  BindU64(st.get(), 10, alert.updated_at_ms);

  int  rc     = sqlite3_step(st.get());
  auto result = Translate(db, rc);
  if (result.code == ErrorCode::ConstraintViolation) {
    // alerts_one_open
    return Result::Err(ErrorCode::AlreadyExists, result.message);
  }
  if (!result) {
    return result;
  }

  alert.id = static_cast<model::AlertId>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

Result SqliteRepository::UpdateAlertStatus(Transaction& t, model::AlertId id, model::AlertStatus status, std::uint64_t updated_at_ms) {
  auto& tx = TX(t);
  auto* db = tx.Handle();

  auto st = tx.DB().Prepare("UPDATE alerts SET status=?,updated_at_ms=? WHERE id=?;");
  BindI32(st.get(), 1, static_cast<int>(status));
  BindU64(st.get(), 2, updated_at_ms);
  BindU64(st.get(), 3, id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    return Translate(db, rc);
  }
  if (sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "alert " + std::to_string(id));
  }
  return Result::Ok();
}

std::optional<model::Alert> SqliteRepository::GetAlert(Transaction& t, model::AlertId id) {
  auto st = TX(t).DB().Prepare(std::string("SELECT ") + kAlertColumns + " FROM alerts WHERE id=?;");
  BindU64(st.get(), 1, id);

  auto rows = Collect<model::Alert>(st.get(), ReadAlert);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::Alert> SqliteRepository::ListAlerts(Transaction& t) {
  auto st = TX(t).DB().Prepare(std::string("SELECT ") + kAlertColumns + " FROM alerts ORDER BY id;");
  return Collect<model::Alert>(st.get(), ReadAlert);
}

} // namespace fraudit::db::sqlite
