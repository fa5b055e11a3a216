#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "evidence/evidence.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/model/alert.hpp"

namespace fraudit::alerts {

struct AlertRequest {
  std::string               alert_type;
  model::Severity           severity = model::Severity::kMedium;
  std::string               title;
  std::string               description;
  model::EntityKind         entity_kind = model::EntityKind::kVendor;
  model::EntityId           entity_id   = 0;
  evidence::AlertEvidence   evidence;
  bool                      skip_duplicate_check = false;
};

enum class CreateOutcome {
  kCreated,
  kDuplicate,
};

struct AlertCreation {
  CreateOutcome  outcome = CreateOutcome::kDuplicate;
  // new row when created, the open row it collided with when known
  model::AlertId id = 0;

  bool Created() const {
    return outcome == CreateOutcome::kCreated;
  }
};

/*
  Idempotent alert creation.

  The duplicate check and the insert run in one write transaction, so at
  most one open alert exists per (alert_type, entity_kind, entity_id) even
  under concurrent rules. skip_duplicate_check only skips the lookup; the
  storage uniqueness still turns a collision into kDuplicate.

  Evidence is serialized to JSON once, here.
*/
class AlertEngine {
 public:
  explicit AlertEngine(std::shared_ptr<db::Repository> repository);

  // Throws util::ValidationError for requests without type, title or entity.
  AlertCreation Create(const AlertRequest& request);

  // Forward-only status workflow. Throws util::NotFound or util::InvalidState.
  model::Alert UpdateStatus(model::AlertId id, model::AlertStatus status);

  std::optional<model::Alert> Get(model::AlertId id) const;

  std::vector<model::Alert> List() const;

  static std::string SerializeEvidence(const evidence::AlertEvidence& evidence);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace fraudit::alerts
