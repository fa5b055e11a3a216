#pragma once

#include <string>

#include "internal/model/entity.hpp"

namespace fraudit::normalize {

// Builds a CanonicalEntity from ingestion fields, deriving the normalized
// name from display_name and the normalized address from the street, city,
// state and zip attributes.
model::CanonicalEntity MakeCanonicalEntity(model::EntityKind kind, model::EntityId id, std::string display_name,
                                           model::EntityAttributes attributes = {});

} // namespace fraudit::normalize
