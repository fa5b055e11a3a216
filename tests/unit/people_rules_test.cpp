#include <cassert>
#include <iostream>
#include <string>

#include "internal/detection/rules/rules.hpp"
#include "tests/unit/rule_fixture.hpp"

namespace {

using fraudit::model::EntityAttributes;
using fraudit::model::EntityKind;
using fraudit::model::Severity;
using fraudit::testing::Find;
using fraudit::testing::HasEdge;
using fraudit::testing::OfType;
using fraudit::testing::RuleFixture;

constexpr std::uint64_t kAgency = 900;

EntityAttributes Staff(const char* title) {
  EntityAttributes attrs;
  attrs.agency_id = kAgency;
  attrs.job_title = title;
  return attrs;
}

EntityAttributes Contribution(double amount, const char* recipient) {
  EntityAttributes attrs;
  attrs.contribution_amount = amount;
  attrs.recipient           = recipient;
  return attrs;
}

void Link(RuleFixture& fixture, EntityKind kind_1, std::uint64_t id_1, EntityKind kind_2, std::uint64_t id_2, const char* relation,
          double confidence) {
  fraudit::model::RelationshipEdge edge;
  edge.kind_1        = kind_1;
  edge.id_1          = id_1;
  edge.kind_2        = kind_2;
  edge.id_2          = id_2;
  edge.relation_type = relation;
  edge.confidence    = confidence;
  edge.evidence      = "{}";
  fixture.relationships->Upsert(edge);
}

void LinkVendors(RuleFixture& fixture, std::uint64_t a, std::uint64_t b, const char* relation) {
  Link(fixture, EntityKind::kVendor, a, EntityKind::kVendor, b, relation, 0.8);
}

void TestEmployeeVendorMatches() {
  RuleFixture fixture;
  fixture.Agency(kAgency, "Department of Transportation");

  fixture.Entity(EntityKind::kEmployee, 101, "John A. Smith", Staff("Purchaser II"));
  fixture.Entity(EntityKind::kEmployee, 102, "Maria Gonzalez", Staff("Contract Specialist"));
  fixture.Entity(EntityKind::kEmployee, 103, "Robert Chen", Staff("Analyst"));

  EntityAttributes home = Staff("Program Manager");
  home.street           = "45 Birch Lane";
  home.city             = "Austin";
  home.state            = "TX";
  home.zip_code         = "78704";
  fixture.Entity(EntityKind::kEmployee, 104, "Linda Park", home);

  fixture.Vendor(1, "John A Smith");
  fixture.Vendor(2, "Maria Gonzales");
  fixture.Vendor(3, "Robert Chen");

  EntityAttributes office;
  office.street   = "45 Birch Ln";
  office.city     = "Austin";
  office.state    = "TX";
  office.zip_code = "78704";
  fixture.Vendor(4, "Park Consulting", office);

  fixture.Pay(1, kAgency, 50000, "2024-02-01");
  fixture.Pay(2, kAgency, 20000, "2024-02-01");
  fixture.Pay(4, kAgency, 15000, "2024-02-01");

  auto rule     = fraudit::detection::MakeEmployeeVendorRule();
  auto requests = fixture.Run(*rule);

  const auto* exact = Find(requests, "employee_vendor_match", 101);
  assert(exact != nullptr);
  assert(exact->entity_kind == EntityKind::kEmployee);
  assert(exact->severity == Severity::kHigh);
  assert(exact->evidence.employee_vendor().vendor().id() == 1);
  assert(exact->evidence.employee_vendor().employee_title() == "Purchaser II");
  assert(exact->description.find("Department of Transportation") != std::string::npos);

  const auto* close = Find(requests, "employee_vendor_match", 102);
  assert(close != nullptr);
  assert(close->severity == Severity::kMedium);

  // matched but never paid: edge only
  assert(Find(requests, "employee_vendor_match", 103) == nullptr);

  const auto* address = Find(requests, "employee_vendor_address_match", 104);
  assert(address != nullptr);
  assert(address->severity == Severity::kHigh);
  assert(address->evidence.employee_vendor().vendor().id() == 4);
  assert(!address->evidence.employee_vendor().shared_address().empty());

  // cross-type edges are stored vendor first
  const auto edges = fixture.relationships->QueryAll();
  assert(HasEdge(edges, 1, 101, "name"));
  assert(HasEdge(edges, 3, 103, "name"));
  assert(HasEdge(edges, 4, 104, "address"));
  for (const auto& edge : edges) {
    assert(edge.kind_1 == EntityKind::kVendor);
    assert(edge.kind_2 == EntityKind::kEmployee);
  }
}

void TestNoEmployeesNoWork() {
  RuleFixture fixture;
  fixture.Vendor(1, "John Smith");
  fixture.Pay(1, kAgency, 50000, "2024-02-01");

  auto rule = fraudit::detection::MakeEmployeeVendorRule();
  assert(fixture.Run(*rule).empty());
  assert(fixture.relationships->QueryAll().empty());
}

void TestRelatedPartyNetworkAndCircularPayments() {
  RuleFixture fixture;
  fixture.Agency(900, "Department of Transportation");
  fixture.Agency(901, "Health Services Commission");

  fixture.Vendor(1, "Apex Roadworks");
  fixture.Vendor(2, "Apex Road Works Texas");
  fixture.Vendor(3, "Summit Striping");
  fixture.Pay(1, 900, 300000, "2024-01-10");
  fixture.Pay(2, 900, 200000, "2024-01-12");
  fixture.Pay(3, 901, 100000, "2024-01-15");
  LinkVendors(fixture, 1, 2, "same_address");
  LinkVendors(fixture, 2, 3, "similar_name");
  LinkVendors(fixture, 1, 3, "sequential_id");

  // a linked trio that is too small to report
  for (std::uint64_t vendor = 10; vendor <= 12; ++vendor) {
    fixture.Vendor(vendor, "Minor Vendor " + std::to_string(vendor));
    fixture.Pay(vendor, 901, 1000, "2024-01-15");
  }
  LinkVendors(fixture, 10, 11, "same_address");
  LinkVendors(fixture, 11, 12, "same_address");

  auto rule     = fraudit::detection::MakeRelatedPartyRule();
  auto requests = fixture.Run(*rule);

  auto networks = OfType(requests, "related_party_network");
  assert(networks.size() == 1);
  assert(networks[0].entity_id == 1);
  // three distinct relation types
  assert(networks[0].severity == Severity::kHigh);

  const auto& ev = networks[0].evidence.related_party_network();
  assert(ev.vendors_size() == 3);
  assert(ev.total_value() == 600000);
  assert(ev.relationship_count() == 3);
  assert(ev.relation_types().at("same_address") == 1);

  auto circular = OfType(requests, "circular_payment_pattern");
  assert(circular.size() == 1);
  assert(circular[0].entity_id == 1);
  assert(circular[0].severity == Severity::kMedium);
  const auto& pattern = circular[0].evidence.circular_payment();
  assert(pattern.vendor_2().id() == 2);
  assert(pattern.vendor_1_total() == 300000);
  assert(pattern.vendor_2_total() == 200000);
  assert(pattern.agencies_size() == 1);
  assert(pattern.agencies(0).agency().id() == 900);
}

void TestEmployeeVendorContributorTriangle() {
  RuleFixture fixture;
  fixture.Agency(902, "Parks and Wildlife");
  fixture.Entity(EntityKind::kEmployee, 120, "Pat Lake", Staff("Director"));
  fixture.Vendor(20, "Lakeside Builders");
  fixture.Pay(20, 902, 40000, "2024-03-01");

  fixture.Entity(EntityKind::kContributor, 300, "Lakeside Builders", Contribution(6000, "Committee A"));
  fixture.Entity(EntityKind::kContributor, 301, "Lakeside Builder", Contribution(5000, "Committee B"));
  fixture.Entity(EntityKind::kContributor, 302, "Unrelated Donor", Contribution(9000, "Committee A"));

  Link(fixture, EntityKind::kEmployee, 120, EntityKind::kVendor, 20, "name", 0.95);

  auto rule      = fraudit::detection::MakeRelatedPartyRule();
  auto triangles = OfType(fixture.Run(*rule), "employee_vendor_contributor_triangle");
  assert(triangles.size() == 1);

  const auto& triangle = triangles[0];
  assert(triangle.entity_kind == EntityKind::kEmployee);
  assert(triangle.entity_id == 120);
  assert(triangle.severity == Severity::kHigh);

  const auto& ev = triangle.evidence.triangle();
  assert(ev.vendor().id() == 20);
  assert(ev.match_type() == "name");
  assert(ev.contribution_count() == 2);
  assert(ev.total_contributions() == 11000);
  assert(ev.recipients_size() == 2);
  assert(ev.recipients(0).name() == "Committee A");
  assert(ev.recipients(0).amount() == 6000);
}

void TestTriangleCountsAtMostFiveContributors() {
  RuleFixture fixture;
  fixture.Agency(903, "Historical Commission");
  fixture.Entity(EntityKind::kEmployee, 130, "Sam Harbor", Staff("Director"));
  fixture.Vendor(30, "Harbor Paving");
  fixture.Pay(30, 903, 40000, "2024-03-01");
  for (std::uint64_t id = 400; id < 409; ++id) {
    fixture.Entity(EntityKind::kContributor, id, "Harbor Paving", Contribution(1000, "Committee C"));
  }
  Link(fixture, EntityKind::kEmployee, 130, EntityKind::kVendor, 30, "name", 0.95);

  auto rule      = fraudit::detection::MakeRelatedPartyRule();
  auto triangles = OfType(fixture.Run(*rule), "employee_vendor_contributor_triangle");
  assert(triangles.size() == 1);

  const auto& ev = triangles[0].evidence.triangle();
  assert(ev.contribution_count() == 5);
  assert(ev.total_contributions() == 5000);
  assert(triangles[0].severity == Severity::kMedium);
}

} // namespace

int main() {
  TestEmployeeVendorMatches();
  TestNoEmployeesNoWork();
  TestRelatedPartyNetworkAndCircularPayments();
  TestEmployeeVendorContributorTriangle();
  TestTriangleCountsAtMostFiveContributors();

  std::cout << "fraudit_unit_people_rules: pass\n";
  return 0;
}
