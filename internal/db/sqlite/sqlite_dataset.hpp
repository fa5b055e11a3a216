#pragma once

#include <memory>

#include "internal/db/api/dataset_reader.hpp"
#include "sqlite_db.hpp"

namespace fraudit::db::sqlite {

/*
  Dataset reader over the ingestion tables, on its own connection so reads
  proceed while the repository connection holds the write lock (WAL).
  The Add methods stand in for ingestion.
*/
class SqliteDataset final : public db::DatasetReader {
 public:
  explicit SqliteDataset(std::shared_ptr<SqliteDB> db);

  void AddEntity(const model::CanonicalEntity& entity);
  void AddPayment(const model::PaymentRecord& payment);
  void AddContract(const model::ContractRecord& contract);

  std::vector<model::CanonicalEntity> ListEntities(model::EntityKind kind) const override;
  std::optional<model::CanonicalEntity> FindEntity(model::EntityKind kind, model::EntityId id) const override;
  std::vector<model::PaymentRecord> ListPayments() const override;
  std::vector<model::ContractRecord> ListContracts() const override;
  std::vector<model::VendorAgencyAggregate> AggregateVendorAgency() const override;

 private:
  void Write(sqlite3_stmt* st, const char* what);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace fraudit::db::sqlite
