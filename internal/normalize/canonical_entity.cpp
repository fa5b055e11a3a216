#include "canonical_entity.hpp"

#include <optional>
#include <string_view>

#include "internal/normalize/address_normalizer.hpp"
#include "internal/normalize/name_normalizer.hpp"

namespace fraudit::normalize {

namespace {

std::optional<std::string_view> View(const std::optional<std::string>& value) {
  if (!value) {
    return std::nullopt;
  }
  return std::string_view(*value);
}

} // namespace

model::CanonicalEntity MakeCanonicalEntity(model::EntityKind kind, model::EntityId id, std::string display_name,
                                           model::EntityAttributes attributes) {
  model::CanonicalEntity entity;
  entity.id              = id;
  entity.kind            = kind;
  entity.normalized_name = CanonicalizeName(display_name);
  entity.display_name    = std::move(display_name);

  const auto& a = attributes;
  if (auto parsed = CanonicalizeAddress(View(a.street), View(a.city), View(a.state), View(a.zip_code))) {
    entity.normalized_address = std::move(parsed->normalized);
  }

  entity.attributes = std::move(attributes);
  return entity;
}

} // namespace fraudit::normalize
