#include "alert.hpp"

namespace fraudit::model {

std::optional<Severity> ParseSeverity(std::string_view text) {
  for (auto severity : {Severity::kLow, Severity::kMedium, Severity::kHigh}) {
    if (ToString(severity) == text) {
      return severity;
    }
  }
  return std::nullopt;
}

std::optional<AlertStatus> ParseAlertStatus(std::string_view text) {
  for (auto status : {AlertStatus::kNew, AlertStatus::kAcknowledged, AlertStatus::kInvestigating, AlertStatus::kResolved,
                      AlertStatus::kFalsePositive}) {
    if (ToString(status) == text) {
      return status;
    }
  }
  return std::nullopt;
}

} // namespace fraudit::model
