#include "sqlite_dataset.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "sqlite_row.hpp"

namespace fraudit::db::sqlite {

using fraudit::observability::IntField;
using fraudit::observability::StringField;

namespace {

constexpr const char* kEntityColumns =
    "kind,id,display_name,normalized_name,normalized_address,external_id,street,city,state,zip_code,phone,"
    "agency_id,job_title,annual_salary,contribution_amount,recipient,registered,active";

model::CanonicalEntity ReadEntity(sqlite3_stmt* st) {
  model::CanonicalEntity entity;
  entity.kind               = static_cast<model::EntityKind>(ColI32(st, 0));
  entity.id                 = ColU64(st, 1);
  entity.display_name       = ColText(st, 2);
  entity.normalized_name    = ColOptText(st, 3);
  entity.normalized_address = ColOptText(st, 4);

  auto& a               = entity.attributes;
  a.external_id         = ColOptText(st, 5);
  a.street              = ColOptText(st, 6);
  a.city                = ColOptText(st, 7);
  a.state               = ColOptText(st, 8);
  a.zip_code            = ColOptText(st, 9);
  a.phone               = ColOptText(st, 10);
  a.agency_id           = ColOptU64(st, 11);
  a.job_title           = ColOptText(st, 12);
  a.annual_salary       = ColOptDouble(st, 13);
  a.contribution_amount = ColOptDouble(st, 14);
  a.recipient           = ColOptText(st, 15);
  a.registered          = ColOptBool(st, 16);
  a.active              = ColOptBool(st, 17);
  return entity;
}

std::optional<util::Date> ReadDate(sqlite3_stmt* st, int col, const char* table, std::uint64_t id) {
  auto text = ColText(st, col);
  auto date = util::ParseDate(text);
  if (!date) {
    FRAUDIT_LOG_WARN("skipping row with malformed date",
                     {StringField("table", table), IntField("id", static_cast<std::int64_t>(id)), StringField("value", text)});
  }
  return date;
}

void CheckDone(sqlite3_stmt* st, int rc) {
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(sqlite3_db_handle(st)));
  }
}

void BindTextValue(sqlite3_stmt* st, int idx, const std::string& v) {
  BindText(st, idx, v);
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  BindI32(st, idx, v ? 1 : 0);
}

} // namespace

SqliteDataset::SqliteDataset(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteDataset::Write(sqlite3_stmt* st, const char* what) {
  auto result = Translate(db_->Handle(), sqlite3_step(st));
  if (!result) {
    throw std::runtime_error(std::string(what) + ": " + result.message);
  }
}

void SqliteDataset::AddEntity(const model::CanonicalEntity& entity) {
  auto st = db_->Prepare(std::string("INSERT OR REPLACE INTO entities(") + kEntityColumns +
                         ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  auto* s = st.get();
  const auto& a = entity.attributes;
  BindI32(s, 1, static_cast<int>(entity.kind));
  BindU64(s, 2, entity.id);
  BindText(s, 3, entity.display_name);
  BindOptional(s, 4, entity.normalized_name, BindTextValue);
  BindOptional(s, 5, entity.normalized_address, BindTextValue);
  BindOptional(s, 6, a.external_id, BindTextValue);
  BindOptional(s, 7, a.street, BindTextValue);
  BindOptional(s, 8, a.city, BindTextValue);
  BindOptional(s, 9, a.state, BindTextValue);
  BindOptional(s, 10, a.zip_code, BindTextValue);
  BindOptional(s, 11, a.phone, BindTextValue);
  BindOptional(s, 12, a.agency_id, BindU64);
  BindOptional(s, 13, a.job_title, BindTextValue);
  BindOptional(s, 14, a.annual_salary, BindDouble);
  BindOptional(s, 15, a.contribution_amount, BindDouble);
  BindOptional(s, 16, a.recipient, BindTextValue);
  BindOptional(s, 17, a.registered, BindBool);
  BindOptional(s, 18, a.active, BindBool);
  Write(s, "insert entity");
}

void SqliteDataset::AddPayment(const model::PaymentRecord& payment) {
  auto st = db_->Prepare("INSERT OR REPLACE INTO payments(id,vendor_id,agency_id,amount,payment_date) VALUES(?,?,?,?,?);");
  BindU64(st.get(), 1, payment.id);
  BindU64(st.get(), 2, payment.vendor_id);
  BindU64(st.get(), 3, payment.agency_id);
  BindDouble(st.get(), 4, payment.amount);
  BindText(st.get(), 5, util::FormatDate(payment.payment_date));
  Write(st.get(), "insert payment");
}

void SqliteDataset::AddContract(const model::ContractRecord& contract) {
  auto st = db_->Prepare(
      "INSERT OR REPLACE INTO contracts(id,vendor_id,agency_id,contract_number,value,start_date,description) VALUES(?,?,?,?,?,?,?);");
  BindU64(st.get(), 1, contract.id);
  BindU64(st.get(), 2, contract.vendor_id);
  BindU64(st.get(), 3, contract.agency_id);
  BindText(st.get(), 4, contract.contract_number);
  BindDouble(st.get(), 5, contract.value);
  BindText(st.get(), 6, util::FormatDate(contract.start_date));
  BindText(st.get(), 7, contract.description);
  Write(st.get(), "insert contract");
}

std::vector<model::CanonicalEntity> SqliteDataset::ListEntities(model::EntityKind kind) const {
  auto st = db_->Prepare(std::string("SELECT ") + kEntityColumns + " FROM entities WHERE kind=? ORDER BY id;");
  BindI32(st.get(), 1, static_cast<int>(kind));

  std::vector<model::CanonicalEntity> out;
  int                                 rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadEntity(st.get()));
  }
  CheckDone(st.get(), rc);
  return out;
}

std::optional<model::CanonicalEntity> SqliteDataset::FindEntity(model::EntityKind kind, model::EntityId id) const {
  auto st = db_->Prepare(std::string("SELECT ") + kEntityColumns + " FROM entities WHERE kind=? AND id=?;");
  BindI32(st.get(), 1, static_cast<int>(kind));
  BindU64(st.get(), 2, id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) {
    return ReadEntity(st.get());
  }
  CheckDone(st.get(), rc);
  return std::nullopt;
}

std::vector<model::PaymentRecord> SqliteDataset::ListPayments() const {
  auto st = db_->Prepare("SELECT id,vendor_id,agency_id,amount,payment_date FROM payments ORDER BY id;");

  std::vector<model::PaymentRecord> out;
  int                               rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::PaymentRecord payment;
    payment.id        = ColU64(st.get(), 0);
    payment.vendor_id = ColU64(st.get(), 1);
    payment.agency_id = ColU64(st.get(), 2);
    payment.amount    = ColDouble(st.get(), 3);
    auto date         = ReadDate(st.get(), 4, "payments", payment.id);
    if (!date) continue;
    payment.payment_date = *date;
    out.push_back(payment);
  }
  CheckDone(st.get(), rc);
  return out;
}

std::vector<model::ContractRecord> SqliteDataset::ListContracts() const {
  auto st = db_->Prepare("SELECT id,vendor_id,agency_id,contract_number,value,start_date,description FROM contracts ORDER BY id;");

  std::vector<model::ContractRecord> out;
  int                                rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::ContractRecord contract;
    contract.id              = ColU64(st.get(), 0);
    contract.vendor_id       = ColU64(st.get(), 1);
    contract.agency_id       = ColU64(st.get(), 2);
    contract.contract_number = ColText(st.get(), 3);
    contract.value           = ColDouble(st.get(), 4);
    auto date                = ReadDate(st.get(), 5, "contracts", contract.id);
    if (!date) continue;
    contract.start_date  = *date;
    contract.description = ColText(st.get(), 6);
    out.push_back(std::move(contract));
  }
  CheckDone(st.get(), rc);
  return out;
}

std::vector<model::VendorAgencyAggregate> SqliteDataset::AggregateVendorAgency() const {
  auto st = db_->Prepare(
      "SELECT vendor_id,agency_id,SUM(pt),SUM(pc),SUM(ct),SUM(cc) FROM ("
      " SELECT vendor_id,agency_id,SUM(amount) AS pt,COUNT(*) AS pc,0.0 AS ct,0 AS cc FROM payments GROUP BY vendor_id,agency_id"
      " UNION ALL"
      " SELECT vendor_id,agency_id,0.0,0,SUM(value),COUNT(*) FROM contracts GROUP BY vendor_id,agency_id"
      ") GROUP BY vendor_id,agency_id ORDER BY vendor_id,agency_id;");

  std::vector<model::VendorAgencyAggregate> out;
  int                                       rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::VendorAgencyAggregate aggregate;
    aggregate.vendor_id      = ColU64(st.get(), 0);
    aggregate.agency_id      = ColU64(st.get(), 1);
    aggregate.payment_total  = ColDouble(st.get(), 2);
    aggregate.payment_count  = ColU64(st.get(), 3);
    aggregate.contract_total = ColDouble(st.get(), 4);
    aggregate.contract_count = ColU64(st.get(), 5);
    out.push_back(aggregate);
  }
  CheckDone(st.get(), rc);
  return out;
}

} // namespace fraudit::db::sqlite
