#pragma once

#include <string>
#include <string_view>

#include "internal/model/entity.hpp"

namespace fraudit::model {

namespace relation {
inline constexpr std::string_view kSameAddress  = "same_address";
inline constexpr std::string_view kSimilarName  = "similar_name";
inline constexpr std::string_view kSequentialId = "sequential_id";
inline constexpr std::string_view kName         = "name";
inline constexpr std::string_view kAddress      = "address";
inline constexpr std::string_view kDebarment    = "debarment";
} // namespace relation

/*
  Relationship between two entities. Cross-type entity matches are edges
  whose kinds differ.

  Stored in canonical order: lower kind first for cross-type edges, lower id
  first otherwise, so a pair plus relation_type maps to exactly one row.
  evidence is JSON, serialized once by the producer.
*/
struct RelationshipEdge {
  EntityKind  kind_1 = EntityKind::kVendor;
  EntityId    id_1   = 0;
  EntityKind  kind_2 = EntityKind::kVendor;
  EntityId    id_2   = 0;
  std::string relation_type;
  double      confidence = 0.0;
  std::string evidence;

  bool IsCrossType() const {
    return kind_1 != kind_2;
  }

  bool Touches(EntityKind kind, EntityId id) const {
    return (kind_1 == kind && id_1 == id) || (kind_2 == kind && id_2 == id);
  }
};

enum class UpsertOutcome {
  kInserted,
  kUpdated,
  kUnchanged,
};

constexpr std::string_view ToString(UpsertOutcome outcome) {
  switch (outcome) {
    case UpsertOutcome::kInserted:
      return "inserted";
    case UpsertOutcome::kUpdated:
      return "updated";
    case UpsertOutcome::kUnchanged:
      return "unchanged";
  }
  return "unknown";
}

// Returns the edge in canonical order.
// Throws util::ValidationError for self-edges, empty relation types and
// confidences outside [0,1].
RelationshipEdge Canonicalize(RelationshipEdge edge);

} // namespace fraudit::model
