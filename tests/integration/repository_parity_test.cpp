#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include "internal/alerts/alert_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_dataset.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_dataset.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/normalize/canonical_entity.hpp"
#include "internal/relationships/relationship_store.hpp"
#include "internal/util/time.hpp"

namespace {

using fraudit::db::DatasetReader;
using fraudit::db::ErrorCode;
using fraudit::db::Repository;
using fraudit::model::Alert;
using fraudit::model::AlertStatus;
using fraudit::model::EntityKind;
using fraudit::model::RelationshipEdge;
using fraudit::model::Severity;
using fraudit::model::UpsertOutcome;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  bool                                              shared_reads = false;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

RelationshipEdge Edge(EntityKind kind_1, uint64_t id_1, EntityKind kind_2, uint64_t id_2, const std::string& type, double confidence) {
  RelationshipEdge edge;
  edge.kind_1        = kind_1;
  edge.id_1          = id_1;
  edge.kind_2        = kind_2;
  edge.id_2          = id_2;
  edge.relation_type = type;
  edge.confidence    = confidence;
  edge.evidence      = R"({"method":")" + type + R"("})";
  return edge;
}

Alert OpenAlert(const std::string& type, uint64_t entity_id) {
  Alert alert;
  alert.alert_type    = type;
  alert.severity      = Severity::kHigh;
  alert.title         = type + " finding";
  alert.description   = "integration";
  alert.entity_kind   = EntityKind::kVendor;
  alert.entity_id     = entity_id;
  alert.evidence      = R"({"ghost_vendor":{"red_flags":["No phone number"]}})";
  alert.status        = AlertStatus::kNew;
  alert.created_at_ms = NowMs();
  alert.updated_at_ms = alert.created_at_ms;
  return alert;
}

void VerifyRelationshipUpsert(Repository& repo) {
  auto tx = repo.Begin();

  UpsertOutcome outcome{};
  assert(repo.UpsertRelationship(*tx, Edge(EntityKind::kVendor, 1, EntityKind::kVendor, 2, "similar_name", 0.86), outcome));
  assert(outcome == UpsertOutcome::kInserted);

  // lower confidence leaves the row alone
  assert(repo.UpsertRelationship(*tx, Edge(EntityKind::kVendor, 1, EntityKind::kVendor, 2, "similar_name", 0.70), outcome));
  assert(outcome == UpsertOutcome::kUnchanged);

  auto raised     = Edge(EntityKind::kVendor, 1, EntityKind::kVendor, 2, "similar_name", 0.93);
  raised.evidence = R"({"method":"similar_name","similarity":0.93})";
  assert(repo.UpsertRelationship(*tx, raised, outcome));
  assert(outcome == UpsertOutcome::kUpdated);

  // same pair, different relation type: separate row
  assert(repo.UpsertRelationship(*tx, Edge(EntityKind::kVendor, 1, EntityKind::kVendor, 2, "same_address", 0.8), outcome));
  assert(outcome == UpsertOutcome::kInserted);
  assert(repo.UpsertRelationship(*tx, Edge(EntityKind::kVendor, 2, EntityKind::kEmployee, 7, "name", 0.95), outcome));
  assert(repo.UpsertRelationship(*tx, Edge(EntityKind::kVendor, 2, EntityKind::kDebarred, 9, "debarment", 1.0), outcome));

  // reads inside the transaction see its writes
  const auto all = repo.ListRelationships(*tx);
  assert(all.size() == 4);
  assert(all[0].relation_type == "same_address");
  assert(all[1].relation_type == "similar_name");
  assert(all[1].confidence == 0.93);
  assert(all[1].evidence.find("0.93") != std::string::npos);
  assert(all[2].kind_2 == EntityKind::kEmployee);
  assert(all[3].kind_2 == EntityKind::kDebarred);

  assert(repo.ListRelationshipsFor(*tx, EntityKind::kVendor, 2).size() == 4);
  assert(repo.ListRelationshipsFor(*tx, EntityKind::kVendor, 1).size() == 2);
  assert(repo.ListRelationshipsFor(*tx, EntityKind::kEmployee, 7).size() == 1);
  assert(repo.ListRelationshipsFor(*tx, EntityKind::kEmployee, 2).empty());
  assert(repo.ListRelationshipsByType(*tx, "debarment").size() == 1);

  tx->Commit();
  assert(tx->IsCommitted());
}

void VerifyRollbackBehavior(Repository& repo) {
  UpsertOutcome outcome{};
  {
    auto tx = repo.Begin();
    assert(repo.UpsertRelationship(*tx, Edge(EntityKind::kVendor, 50, EntityKind::kVendor, 51, "sequential_id", 0.9), outcome));
    tx->Rollback();
  }
  {
    // destructor rolls back
    auto tx    = repo.Begin();
    auto alert = OpenAlert("rolled_back", 50);
    assert(repo.InsertAlert(*tx, alert));
  }

  auto check = repo.BeginRead();
  assert(repo.ListRelationshipsFor(*check, EntityKind::kVendor, 50).empty());
  assert(!repo.FindOpenAlert(*check, "rolled_back", EntityKind::kVendor, 50).has_value());
  check->Commit();

  // committed rows survive a rolled-back update of the same rows
  auto kept = OpenAlert("kept", 60);
  {
    auto tx = repo.Begin();
    assert(repo.UpsertRelationship(*tx, Edge(EntityKind::kVendor, 60, EntityKind::kVendor, 61, "same_address", 0.5), outcome));
    assert(repo.InsertAlert(*tx, kept));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.UpsertRelationship(*tx, Edge(EntityKind::kVendor, 60, EntityKind::kVendor, 61, "same_address", 0.9), outcome));
    assert(outcome == UpsertOutcome::kUpdated);
    assert(repo.UpdateAlertStatus(*tx, kept.id, AlertStatus::kResolved, NowMs()));
    auto replacement = OpenAlert("kept", 60);
    assert(repo.InsertAlert(*tx, replacement));
    tx->Rollback();
  }

  auto after = repo.BeginRead();
  auto edges = repo.ListRelationshipsFor(*after, EntityKind::kVendor, 61);
  assert(edges.size() == 1);
  assert(edges[0].confidence == 0.5);
  auto open = repo.FindOpenAlert(*after, "kept", EntityKind::kVendor, 60);
  assert(open.has_value());
  assert(open->id == kept.id);
  assert(open->status == AlertStatus::kNew);
  after->Commit();
}

// Two read transactions are open at the same time on different threads.
void VerifySharedReaders(Repository& repo) {
  auto first = repo.BeginRead();

  std::promise<void> opened;
  auto               second_opened = opened.get_future();
  std::thread        reader([&] {
    auto second = repo.BeginRead();
    opened.set_value();
    assert(repo.ListRelationshipsFor(*second, EntityKind::kVendor, 61).size() == 1);
    second->Commit();
  });

  const bool concurrent = second_opened.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
  first->Commit();
  reader.join();
  assert(concurrent);

  // writes through a read transaction are refused
  auto          read_only = repo.BeginRead();
  UpsertOutcome outcome{};
  bool          refused = false;
  try {
    (void)repo.UpsertRelationship(*read_only, Edge(EntityKind::kVendor, 70, EntityKind::kVendor, 71, "same_address", 0.8), outcome);
  } catch (const std::logic_error&) {
    refused = true;
  }
  assert(refused);
  read_only->Commit();
}

void VerifyAlertLifecycle(Repository& repo) {
  auto tx = repo.Begin();

  auto first = OpenAlert("ghost_vendor", 42);
  assert(repo.InsertAlert(*tx, first));
  assert(first.id != 0);

  auto read = repo.GetAlert(*tx, first.id);
  assert(read.has_value());
  assert(read->alert_type == "ghost_vendor");
  assert(read->severity == Severity::kHigh);
  assert(read->entity_kind == EntityKind::kVendor);
  assert(read->entity_id == 42);
  assert(read->evidence == first.evidence);
  assert(read->status == AlertStatus::kNew);

  // one open alert per key
  auto second = OpenAlert("ghost_vendor", 42);
  auto dup    = repo.InsertAlert(*tx, second);
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);

  auto found = repo.FindOpenAlert(*tx, "ghost_vendor", EntityKind::kVendor, 42);
  assert(found.has_value());
  assert(found->id == first.id);

  assert(repo.UpdateAlertStatus(*tx, first.id, AlertStatus::kInvestigating, NowMs()));
  assert(repo.FindOpenAlert(*tx, "ghost_vendor", EntityKind::kVendor, 42).has_value());

  // closing frees the key
  assert(repo.UpdateAlertStatus(*tx, first.id, AlertStatus::kResolved, NowMs()));
  assert(!repo.FindOpenAlert(*tx, "ghost_vendor", EntityKind::kVendor, 42).has_value());

  auto third = OpenAlert("ghost_vendor", 42);
  assert(repo.InsertAlert(*tx, third));
  assert(third.id > first.id);

  // reopening the resolved one would make two open alerts
  auto reopen = repo.UpdateAlertStatus(*tx, first.id, AlertStatus::kNew, NowMs());
  assert(reopen.code == ErrorCode::ConstraintViolation);

  auto missing = repo.UpdateAlertStatus(*tx, 999999, AlertStatus::kResolved, NowMs());
  assert(missing.code == ErrorCode::NotFound);
  assert(!repo.GetAlert(*tx, 999999).has_value());

  const auto alerts = repo.ListAlerts(*tx);
  assert(alerts.size() == 2);
  assert(alerts[0].id == first.id);
  assert(alerts[0].status == AlertStatus::kResolved);
  assert(alerts[1].id == third.id);

  tx->Commit();
}

void VerifyConcurrentWriters(const std::shared_ptr<Repository>& repo) {
  fraudit::relationships::RelationshipStore store(repo);
  fraudit::alerts::AlertEngine              engine(repo);

  std::vector<std::thread> threads;
  std::vector<int>         created(6, 0);
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&, i] {
      store.Upsert(Edge(EntityKind::kVendor, 80, EntityKind::kVendor, 81, "same_address", 0.5 + 0.05 * i));

      fraudit::alerts::AlertRequest request;
      request.alert_type  = "vendor_cluster_address";
      request.title       = "Multiple vendors at same address (3 vendors)";
      request.entity_kind = EntityKind::kVendor;
      request.entity_id   = 80;
      created[i]          = engine.Create(request).Created() ? 1 : 0;
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  const auto edges = store.QueryRelated(EntityKind::kVendor, 81);
  assert(edges.size() == 1);
  assert(edges[0].confidence > 0.74);

  int total = 0;
  for (int value : created) total += value;
  assert(total == 1);
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto          tx = repo->Begin();
    UpsertOutcome outcome{};
    assert(repo->UpsertRelationship(*tx, Edge(EntityKind::kVendor, 90, EntityKind::kVendor, 91, "same_address", 0.8), outcome));
    auto alert = OpenAlert("durable", 90);
    assert(repo->InsertAlert(*tx, alert));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->ListRelationshipsFor(*tx, EntityKind::kVendor, 91).size() == 1);
  auto alert = repo->FindOpenAlert(*tx, "durable", EntityKind::kVendor, 90);
  assert(alert.has_value());
  assert(alert->title == "durable finding");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<fraudit::db::memory::MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .shared_reads     = true,
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

std::string TempDbPath(const std::string& tag) {
  return (std::filesystem::temp_directory_path() / ("fraudit_integration_" + tag + "_" + std::to_string(NowMs()) + ".db")).string();
}

void RemoveDb(const std::string& path) {
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path + suffix);
  }
}

BackendFactory MakeSqliteFactory() {
  auto db_path = TempDbPath("repository");

  auto make_repo = [db_path]() {
    auto db = std::make_shared<fraudit::db::sqlite::SqliteDB>(db_path);
    fraudit::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<fraudit::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { RemoveDb(db_path); },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();
    VerifyRelationshipUpsert(*repo);
    VerifyRollbackBehavior(*repo);
    VerifyAlertLifecycle(*repo);
    VerifyConcurrentWriters(repo);
    if (backend.shared_reads) {
      VerifySharedReaders(*repo);
    }
  }
  VerifyRestartDurability(backend);
  backend.cleanup();
}

// ---------------------------------------------------------------------------
// Dataset readers
// ---------------------------------------------------------------------------

template <typename Dataset>
void Seed(Dataset& dataset) {
  using fraudit::normalize::MakeCanonicalEntity;

  fraudit::model::EntityAttributes vendor;
  vendor.external_id = "17412345678";
  vendor.street      = "100 North Main Street";
  vendor.city        = "Austin";
  vendor.state       = "Texas";
  vendor.zip_code    = "78701-1234";
  vendor.phone       = "512-555-0100";
  vendor.registered  = true;
  dataset.AddEntity(MakeCanonicalEntity(EntityKind::kVendor, 2, "The Acme Corporation, Inc.", vendor));
  dataset.AddEntity(MakeCanonicalEntity(EntityKind::kVendor, 1, "Bravo Logistics", {}));

  fraudit::model::EntityAttributes employee;
  employee.agency_id     = 900;
  employee.job_title     = "Purchaser II";
  employee.annual_salary = 61000.5;
  dataset.AddEntity(MakeCanonicalEntity(EntityKind::kEmployee, 101, "John A. Smith", employee));

  fraudit::model::EntityAttributes excluded;
  excluded.active = false;
  dataset.AddEntity(MakeCanonicalEntity(EntityKind::kDebarred, 500, "Shadow Supply LLC", excluded));
  dataset.AddEntity(MakeCanonicalEntity(EntityKind::kAgency, 900, "Department of Transportation", {}));

  std::uint64_t id = 1;
  for (const auto& [vendor_id, agency_id, amount, date] :
       std::vector<std::tuple<uint64_t, uint64_t, double, const char*>>{{1, 900, 1000.25, "2024-01-05"},
                                                                         {1, 900, 2000.0, "2024-02-05"},
                                                                         {2, 900, 5000.0, "2023-08-30"},
                                                                         {2, 901, 750.0, "2023-09-01"}}) {
    fraudit::model::PaymentRecord payment;
    payment.id           = id++;
    payment.vendor_id    = vendor_id;
    payment.agency_id    = agency_id;
    payment.amount       = amount;
    payment.payment_date = *fraudit::util::ParseDate(date);
    dataset.AddPayment(payment);
  }

  fraudit::model::ContractRecord contract;
  contract.id              = 1;
  contract.vendor_id       = 2;
  contract.agency_id       = 900;
  contract.contract_number = "C-2024-001";
  contract.value           = 45000;
  contract.start_date      = *fraudit::util::ParseDate("2024-03-01");
  contract.description     = "Road maintenance";
  dataset.AddContract(contract);
}

void VerifyDatasetParity(const DatasetReader& memory, const DatasetReader& sqlite) {
  for (auto kind : {EntityKind::kVendor, EntityKind::kEmployee, EntityKind::kDebarred, EntityKind::kAgency, EntityKind::kContributor}) {
    const auto a = memory.ListEntities(kind);
    const auto b = sqlite.ListEntities(kind);
    assert(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
      assert(a[i].id == b[i].id);
      assert(a[i].kind == b[i].kind);
      assert(a[i].display_name == b[i].display_name);
      assert(a[i].normalized_name == b[i].normalized_name);
      assert(a[i].normalized_address == b[i].normalized_address);
      assert(a[i].attributes.external_id == b[i].attributes.external_id);
      assert(a[i].attributes.zip_code == b[i].attributes.zip_code);
      assert(a[i].attributes.agency_id == b[i].attributes.agency_id);
      assert(a[i].attributes.annual_salary == b[i].attributes.annual_salary);
      assert(a[i].attributes.registered == b[i].attributes.registered);
      assert(a[i].attributes.active == b[i].attributes.active);
    }
  }

  const auto vendors = sqlite.ListEntities(EntityKind::kVendor);
  assert(vendors.size() == 2);
  assert(vendors[0].id == 1);
  assert(*vendors[1].normalized_name == "ACME CORP INC");
  assert(vendors[1].normalized_address.has_value());
  assert(!vendors[0].attributes.registered.has_value());

  auto found = sqlite.FindEntity(EntityKind::kEmployee, 101);
  assert(found.has_value());
  assert(found->attributes.job_title == "Purchaser II");
  assert(!sqlite.FindEntity(EntityKind::kVendor, 101).has_value());
  assert(!memory.FindEntity(EntityKind::kVendor, 101).has_value());

  const auto pa = memory.ListPayments();
  const auto pb = sqlite.ListPayments();
  assert(pa.size() == 4 && pb.size() == 4);
  for (std::size_t i = 0; i < pa.size(); ++i) {
    assert(pa[i].id == pb[i].id);
    assert(pa[i].amount == pb[i].amount);
    assert(pa[i].payment_date == pb[i].payment_date);
  }

  const auto ca = memory.ListContracts();
  const auto cb = sqlite.ListContracts();
  assert(ca.size() == 1 && cb.size() == 1);
  assert(ca[0].contract_number == cb[0].contract_number);
  assert(ca[0].start_date == cb[0].start_date);

  const auto aa = memory.AggregateVendorAgency();
  const auto ab = sqlite.AggregateVendorAgency();
  assert(aa.size() == 3 && ab.size() == 3);
  for (std::size_t i = 0; i < aa.size(); ++i) {
    assert(aa[i].vendor_id == ab[i].vendor_id);
    assert(aa[i].agency_id == ab[i].agency_id);
    assert(aa[i].payment_total == ab[i].payment_total);
    assert(aa[i].payment_count == ab[i].payment_count);
    assert(aa[i].contract_total == ab[i].contract_total);
    assert(aa[i].contract_count == ab[i].contract_count);
  }
  assert(ab[0].vendor_id == 1 && ab[0].payment_count == 2 && ab[0].payment_total == 3000.25);
  assert(ab[1].vendor_id == 2 && ab[1].agency_id == 900 && ab[1].contract_count == 1);
}

void RunDatasetSuite() {
  std::cout << "running dataset suite\n";
  const auto path = TempDbPath("dataset");
  {
    fraudit::db::memory::MemoryDataset memory;
    Seed(memory);

    auto db = std::make_shared<fraudit::db::sqlite::SqliteDB>(path);
    fraudit::db::sqlite::BootstrapSchema(*db);
    fraudit::db::sqlite::SqliteDataset sqlite(db);
    Seed(sqlite);

    VerifyDatasetParity(memory, sqlite);
  }
  RemoveDb(path);
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }
  RunDatasetSuite();

  std::cout << "fraudit_integration_repository_parity: pass\n";
  return 0;
}
