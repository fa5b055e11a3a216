#include "memory_dataset.hpp"

#include <mutex>

namespace fraudit::db::memory {

void MemoryDataset::AddEntity(model::CanonicalEntity entity) {
  std::unique_lock lock(mutex_);
  auto             key = std::make_pair(entity.kind, entity.id);
  entities_[key]       = std::move(entity);
}

void MemoryDataset::AddPayment(model::PaymentRecord payment) {
  std::unique_lock lock(mutex_);
  payments_[payment.id] = payment;
}

void MemoryDataset::AddContract(model::ContractRecord contract) {
  std::unique_lock lock(mutex_);
  auto             id = contract.id;
  contracts_[id]      = std::move(contract);
}

std::vector<model::CanonicalEntity> MemoryDataset::ListEntities(model::EntityKind kind) const {
  std::shared_lock                    lock(mutex_);
  std::vector<model::CanonicalEntity> out;
  for (auto it = entities_.lower_bound({kind, 0}); it != entities_.end() && it->first.first == kind; ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::optional<model::CanonicalEntity> MemoryDataset::FindEntity(model::EntityKind kind, model::EntityId id) const {
  std::shared_lock lock(mutex_);
  auto             it = entities_.find({kind, id});
  if (it == entities_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PaymentRecord> MemoryDataset::ListPayments() const {
  std::shared_lock                  lock(mutex_);
  std::vector<model::PaymentRecord> out;
  out.reserve(payments_.size());
  for (const auto& [_, payment] : payments_) {
    out.push_back(payment);
  }
  return out;
}

std::vector<model::ContractRecord> MemoryDataset::ListContracts() const {
  std::shared_lock                   lock(mutex_);
  std::vector<model::ContractRecord> out;
  out.reserve(contracts_.size());
  for (const auto& [_, contract] : contracts_) {
    out.push_back(contract);
  }
  return out;
}

std::vector<model::VendorAgencyAggregate> MemoryDataset::AggregateVendorAgency() const {
  std::shared_lock lock(mutex_);

  std::map<std::pair<model::EntityId, model::EntityId>, model::VendorAgencyAggregate> totals;
  auto slot = [&](model::EntityId vendor_id, model::EntityId agency_id) -> model::VendorAgencyAggregate& {
    auto& aggregate     = totals[{vendor_id, agency_id}];
    aggregate.vendor_id = vendor_id;
    aggregate.agency_id = agency_id;
    return aggregate;
  };

  for (const auto& [_, payment] : payments_) {
    auto& aggregate = slot(payment.vendor_id, payment.agency_id);
    aggregate.payment_total += payment.amount;
    ++aggregate.payment_count;
  }
  for (const auto& [_, contract] : contracts_) {
    auto& aggregate = slot(contract.vendor_id, contract.agency_id);
    aggregate.contract_total += contract.value;
    ++aggregate.contract_count;
  }

  std::vector<model::VendorAgencyAggregate> out;
  out.reserve(totals.size());
  for (const auto& [_, aggregate] : totals) {
    out.push_back(aggregate);
  }
  return out;
}

} // namespace fraudit::db::memory
