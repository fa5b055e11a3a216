#pragma once

#include <optional>
#include <vector>

#include "internal/model/entity.hpp"
#include "internal/model/transaction.hpp"

namespace fraudit::db {

/*
  Read-only view of the ingested dataset, queried fresh per run.
  Implementations are safe for concurrent readers.

  Lists are ordered by id; aggregates by (vendor_id, agency_id).
*/
class DatasetReader {
 public:
  virtual ~DatasetReader() = default;

  virtual std::vector<model::CanonicalEntity> ListEntities(model::EntityKind kind) const = 0;

  virtual std::optional<model::CanonicalEntity> FindEntity(model::EntityKind kind, model::EntityId id) const = 0;

  virtual std::vector<model::PaymentRecord> ListPayments() const = 0;

  virtual std::vector<model::ContractRecord> ListContracts() const = 0;

  virtual std::vector<model::VendorAgencyAggregate> AggregateVendorAgency() const = 0;
};

} // namespace fraudit::db
