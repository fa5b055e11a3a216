#include "alert_engine.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/db/api/db_error.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fraudit::alerts {

using fraudit::observability::IntField;
using fraudit::observability::StringField;

namespace {

void Validate(const AlertRequest& request) {
  if (request.alert_type.empty()) {
    throw util::ValidationError("alert request requires an alert type");
  }
  if (request.title.empty()) {
    throw util::ValidationError("alert request requires a title: " + request.alert_type);
  }
  if (request.entity_id == 0) {
    throw util::ValidationError("alert request requires an entity id: " + request.alert_type);
  }
}

} // namespace

AlertEngine::AlertEngine(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::string AlertEngine::SerializeEvidence(const evidence::AlertEvidence& evidence) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(evidence, &json, options);
  if (!status.ok()) {
    throw util::ComputeError("failed to serialize alert evidence: " + std::string(status.message()));
  }
  return json;
}

AlertCreation AlertEngine::Create(const AlertRequest& request) {
  Validate(request);

  model::Alert alert;
  alert.alert_type    = request.alert_type;
  alert.severity      = request.severity;
  alert.title         = request.title;
  alert.description   = request.description;
  alert.entity_kind   = request.entity_kind;
  alert.entity_id     = request.entity_id;
  alert.evidence      = SerializeEvidence(request.evidence);
  alert.status        = model::AlertStatus::kNew;
  alert.created_at_ms = util::ToUnixMillis(util::Now());
  alert.updated_at_ms = alert.created_at_ms;

  auto tx = repository_->Begin();

  if (!request.skip_duplicate_check) {
    if (auto existing = repository_->FindOpenAlert(*tx, alert.alert_type, alert.entity_kind, alert.entity_id)) {
      tx->Rollback();
      FRAUDIT_LOG_DEBUG("duplicate alert suppressed",
                        {StringField("type", alert.alert_type), IntField("entity_id", static_cast<std::int64_t>(alert.entity_id)),
                         IntField("open_alert", static_cast<std::int64_t>(existing->id))});
      return {CreateOutcome::kDuplicate, existing->id};
    }
  }

  auto result = repository_->InsertAlert(*tx, alert);
  if (result.code == db::ErrorCode::AlreadyExists) {
    tx->Rollback();
    FRAUDIT_LOG_DEBUG("duplicate alert rejected by storage",
                      {StringField("type", alert.alert_type), IntField("entity_id", static_cast<std::int64_t>(alert.entity_id))});
    return {CreateOutcome::kDuplicate, 0};
  }
  db::ThrowIfDbError(result, "insert alert");
  tx->Commit();

  return {CreateOutcome::kCreated, alert.id};
}

model::Alert AlertEngine::UpdateStatus(model::AlertId id, model::AlertStatus status) {
  auto tx      = repository_->Begin();
  auto current = repository_->GetAlert(*tx, id);
  if (!current) {
    throw util::NotFound("alert " + std::to_string(id));
  }

  if (!model::CanTransition(current->status, status)) {
    throw util::InvalidState("alert " + std::to_string(id) + " cannot move from " + std::string(model::ToString(current->status)) +
                             " to " + std::string(model::ToString(status)));
  }

  const auto now_ms = util::ToUnixMillis(util::Now());
  db::ThrowIfDbError(repository_->UpdateAlertStatus(*tx, id, status, now_ms), "update alert status");
  tx->Commit();

  current->status        = status;
  current->updated_at_ms = now_ms;
  return *current;
}

std::optional<model::Alert> AlertEngine::Get(model::AlertId id) const {
  auto tx    = repository_->BeginRead();
  auto alert = repository_->GetAlert(*tx, id);
  tx->Commit();
  return alert;
}

std::vector<model::Alert> AlertEngine::List() const {
  auto tx     = repository_->BeginRead();
  auto alerts = repository_->ListAlerts(*tx);
  tx->Commit();
  return alerts;
}

} // namespace fraudit::alerts
