#include "relationship.hpp"

#include <cmath>
#include <utility>

#include "internal/util/errors.hpp"

namespace fraudit::model {

RelationshipEdge Canonicalize(RelationshipEdge edge) {
  if (edge.relation_type.empty()) {
    throw util::ValidationError("relationship edge requires a relation type");
  }
  if (!std::isfinite(edge.confidence) || edge.confidence < 0.0 || edge.confidence > 1.0) {
    throw util::ValidationError("relationship confidence outside [0,1]: " + std::to_string(edge.confidence));
  }
  if (edge.kind_1 == edge.kind_2 && edge.id_1 == edge.id_2) {
    throw util::ValidationError("relationship edge cannot link an entity to itself: " + std::string(ToString(edge.kind_1)) + " " +
                                std::to_string(edge.id_1));
  }

  const bool swap = edge.kind_1 != edge.kind_2 ? edge.kind_2 < edge.kind_1 : edge.id_2 < edge.id_1;
  if (swap) {
    std::swap(edge.kind_1, edge.kind_2);
    std::swap(edge.id_1, edge.id_2);
  }
  return edge;
}

} // namespace fraudit::model
