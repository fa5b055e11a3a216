#include "entity.hpp"

namespace fraudit::model {

std::optional<EntityKind> ParseEntityKind(std::string_view text) {
  for (auto kind : {EntityKind::kVendor, EntityKind::kEmployee, EntityKind::kContributor, EntityKind::kAgency, EntityKind::kDebarred}) {
    if (ToString(kind) == text) {
      return kind;
    }
  }
  return std::nullopt;
}

} // namespace fraudit::model
