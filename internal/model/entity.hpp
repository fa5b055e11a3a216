#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fraudit::model {

using EntityId = std::uint64_t;

// Declaration order is the cross-type canonical order of relationship edges.
enum class EntityKind : std::uint8_t {
  kVendor      = 1,
  kEmployee    = 2,
  kContributor = 3,
  kAgency      = 4,
  kDebarred    = 5,
};

constexpr std::string_view ToString(EntityKind kind) {
  switch (kind) {
    case EntityKind::kVendor:
      return "vendor";
    case EntityKind::kEmployee:
      return "employee";
    case EntityKind::kContributor:
      return "contributor";
    case EntityKind::kAgency:
      return "agency";
    case EntityKind::kDebarred:
      return "debarred";
  }
  return "unknown";
}

std::optional<EntityKind> ParseEntityKind(std::string_view text);

/*
  Ingestion-owned attributes. Read-only inputs to rules and severity scoring.
  Which fields are populated depends on the entity kind.
*/
struct EntityAttributes {
  // vendor number, employee id, UEI / exclusion id
  std::optional<std::string> external_id;

  std::optional<std::string> street;
  std::optional<std::string> city;
  std::optional<std::string> state;
  std::optional<std::string> zip_code;
  std::optional<std::string> phone;

  // employee
  std::optional<EntityId>    agency_id;
  std::optional<std::string> job_title;
  std::optional<double>      annual_salary;

  // contributor
  std::optional<double>      contribution_amount;
  std::optional<std::string> recipient;

  // vendor: registered in the master bidders list
  std::optional<bool> registered;
  // debarred: exclusion currently in force
  std::optional<bool> active;
};

/*
  Entity after canonicalization. Identity is immutable; normalized_name is
  absent when canonicalization produced nothing, and such entities are
  skipped by matching.
*/
struct CanonicalEntity {
  EntityId                   id   = 0;
  EntityKind                 kind = EntityKind::kVendor;
  std::string                display_name;
  std::optional<std::string> normalized_name;
  std::optional<std::string> normalized_address;
  EntityAttributes           attributes;
};

} // namespace fraudit::model
