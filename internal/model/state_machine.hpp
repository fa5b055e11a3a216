#pragma once

#include <cstdint>

#include "internal/model/alert.hpp"

namespace fraudit::model {

// new, acknowledged and investigating alerts are open; at most one open
// alert exists per (alert_type, entity_kind, entity_id).
constexpr bool IsOpen(AlertStatus status) {
  return status == AlertStatus::kNew || status == AlertStatus::kAcknowledged || status == AlertStatus::kInvestigating;
}

constexpr bool IsTerminal(AlertStatus status) {
  return status == AlertStatus::kResolved || status == AlertStatus::kFalsePositive;
}

constexpr bool CanTransition(AlertStatus from, AlertStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == AlertStatus::kNew) {
    return false;
  }
  if (IsTerminal(to)) {
    return true;
  }

  return static_cast<std::uint8_t>(to) >= static_cast<std::uint8_t>(from);
}

} // namespace fraudit::model
