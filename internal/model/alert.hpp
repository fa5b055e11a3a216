#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/entity.hpp"
#include "internal/util/time.hpp"

namespace fraudit::model {

using AlertId = std::uint64_t;

enum class Severity : std::uint8_t {
  kLow    = 1,
  kMedium = 2,
  kHigh   = 3,
};

enum class AlertStatus : std::uint8_t {
  kNew           = 1,
  kAcknowledged  = 2,
  kInvestigating = 3,
  kResolved      = 4,
  kFalsePositive = 5,
};

constexpr std::string_view ToString(Severity severity) {
  switch (severity) {
    case Severity::kLow:
      return "low";
    case Severity::kMedium:
      return "medium";
    case Severity::kHigh:
      return "high";
  }
  return "unknown";
}

constexpr std::string_view ToString(AlertStatus status) {
  switch (status) {
    case AlertStatus::kNew:
      return "new";
    case AlertStatus::kAcknowledged:
      return "acknowledged";
    case AlertStatus::kInvestigating:
      return "investigating";
    case AlertStatus::kResolved:
      return "resolved";
    case AlertStatus::kFalsePositive:
      return "false_positive";
  }
  return "unknown";
}

std::optional<Severity> ParseSeverity(std::string_view text);
std::optional<AlertStatus> ParseAlertStatus(std::string_view text);

struct Alert {
  AlertId     id = 0;
  std::string alert_type;
  Severity    severity = Severity::kMedium;
  std::string title;
  std::string description;
  EntityKind  entity_kind = EntityKind::kVendor;
  EntityId    entity_id   = 0;
  std::string evidence;
  AlertStatus status = AlertStatus::kNew;
  std::uint64_t created_at_ms = 0;
  std::uint64_t updated_at_ms = 0;
};

} // namespace fraudit::model
