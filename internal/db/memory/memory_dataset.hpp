#pragma once

#include <map>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "internal/db/api/dataset_reader.hpp"

namespace fraudit::db::memory {

/*
  In-memory dataset. Populated by the caller before a run; the Add methods
  stand in for ingestion and replace rows with the same id.
*/
class MemoryDataset final : public db::DatasetReader {
 public:
  void AddEntity(model::CanonicalEntity entity);
  void AddPayment(model::PaymentRecord payment);
  void AddContract(model::ContractRecord contract);

  std::vector<model::CanonicalEntity> ListEntities(model::EntityKind kind) const override;
  std::optional<model::CanonicalEntity> FindEntity(model::EntityKind kind, model::EntityId id) const override;
  std::vector<model::PaymentRecord> ListPayments() const override;
  std::vector<model::ContractRecord> ListContracts() const override;
  std::vector<model::VendorAgencyAggregate> AggregateVendorAgency() const override;

 private:
  mutable std::shared_mutex mutex_;

  std::map<std::pair<model::EntityKind, model::EntityId>, model::CanonicalEntity> entities_;
  std::map<std::uint64_t, model::PaymentRecord>                                   payments_;
  std::map<std::uint64_t, model::ContractRecord>                                  contracts_;
};

} // namespace fraudit::db::memory
