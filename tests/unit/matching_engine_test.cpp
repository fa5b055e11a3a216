#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "internal/match/matching_engine.hpp"
#include "internal/normalize/canonical_entity.hpp"

namespace {

using fraudit::match::CandidatePair;
using fraudit::match::MatchingEngine;
using fraudit::match::MatchingOptions;
using fraudit::model::CanonicalEntity;
using fraudit::model::EntityId;
using fraudit::model::EntityKind;

CanonicalEntity Make(EntityKind kind, EntityId id, const std::string& name) {
  return fraudit::normalize::MakeCanonicalEntity(kind, id, name);
}

std::vector<CanonicalEntity> Vendors() {
  return {
      Make(EntityKind::kVendor, 5, "Bravo Logistic"),
      Make(EntityKind::kVendor, 1, "Acme Supply Co"),
      Make(EntityKind::kVendor, 2, "ACME SUPPLY COMPANY"),
      Make(EntityKind::kVendor, 3, "Acme Supplies Co."),
      Make(EntityKind::kVendor, 4, "Bravo Logistics"),
      Make(EntityKind::kVendor, 6, "..."),
  };
}

bool Has(const std::vector<CandidatePair>& pairs, EntityId a, EntityId b) {
  for (const auto& pair : pairs) {
    if (pair.id_1 == a && pair.id_2 == b) {
      return true;
    }
  }
  return false;
}

void TestSelfMatch() {
  MatchingEngine engine(MatchingOptions{});
  auto           report = engine.Match(Vendors(), nullptr, 0.85, 10);

  assert(report.skipped_entities == 1);
  assert(report.failed_batches == 0);
  assert(report.pairs.size() == 2);

  // sorted by (id_1, id_2), lower id first
  assert(report.pairs[0].id_1 == 1 && report.pairs[0].id_2 == 2);
  assert(report.pairs[0].score == 1.0);
  assert(report.pairs[1].id_1 == 4 && report.pairs[1].id_2 == 5);
  assert(report.pairs[1].score > 0.9 && report.pairs[1].score < 1.0);

  // 1-3 and 2-3 only score 0.8125
  auto loose = engine.Match(Vendors(), nullptr, 0.8, 10);
  assert(Has(loose.pairs, 1, 3));
  assert(Has(loose.pairs, 2, 3));
}

void TestMatchingIsIdempotentAcrossWorkerLayouts() {
  MatchingOptions sequential;
  sequential.batch_size  = 100;
  sequential.max_workers = 1;

  MatchingOptions parallel;
  parallel.batch_size  = 1;
  parallel.max_workers = 4;

  auto a = MatchingEngine(sequential).Match(Vendors(), nullptr, 0.8, 10);
  auto b = MatchingEngine(parallel).Match(Vendors(), nullptr, 0.8, 10);
  assert(a.pairs.size() == b.pairs.size());
  for (std::size_t i = 0; i < a.pairs.size(); ++i) {
    assert(a.pairs[i].id_1 == b.pairs[i].id_1);
    assert(a.pairs[i].id_2 == b.pairs[i].id_2);
    assert(a.pairs[i].score == b.pairs[i].score);
  }
}

void TestCrossMatchKeepsOrientation() {
  MatchingEngine engine(MatchingOptions{});

  std::vector<CanonicalEntity> employees = {
      Make(EntityKind::kEmployee, 101, "Acme Supply Co"),
      Make(EntityKind::kEmployee, 102, "Acme Supply Corp"),
  };

  const auto vendors = Vendors();

  // id_1 always comes from the entity side, whichever side is queried
  auto report = engine.Match(employees, &vendors, 0.9, 10);
  assert(report.pairs.size() == 2);
  assert(Has(report.pairs, 101, 1));
  assert(Has(report.pairs, 101, 2));

  // each vendor keeps its single best employee
  auto limited = engine.Match(vendors, &employees, 0.85, 1);
  assert(Has(limited.pairs, 1, 101));
  assert(!Has(limited.pairs, 1, 102));
  assert(Has(limited.pairs, 2, 101));
}

void TestCrossLimitAppliesToEachEntity() {
  MatchingEngine engine(MatchingOptions{});

  std::vector<CanonicalEntity> vendors = {Make(EntityKind::kVendor, 1, "Acme Supply")};
  std::vector<CanonicalEntity> contributors;
  for (std::uint64_t id = 300; id < 350; ++id) {
    contributors.push_back(Make(EntityKind::kContributor, id, "Acme Supply"));
  }

  // the reference side is larger, yet the one vendor still gets only five partners
  auto report = engine.Match(vendors, &contributors, 0.8, 5);
  assert(report.pairs.size() == 5);
  for (std::size_t i = 0; i < report.pairs.size(); ++i) {
    assert(report.pairs[i].id_1 == 1);
    assert(report.pairs[i].id_2 == 300 + i);
    assert(report.pairs[i].score == 1.0);
  }

  // and the result does not depend on how the contributors are batched
  MatchingOptions small_batches;
  small_batches.batch_size  = 7;
  small_batches.max_workers = 3;
  auto batched              = MatchingEngine(small_batches).Match(vendors, &contributors, 0.8, 5);
  assert(batched.pairs.size() == 5);
  assert(batched.pairs[4].id_2 == 304);
}

void TestOversizeBlocksAreTruncated() {
  MatchingOptions options;
  options.max_block_size = 1;

  auto report = MatchingEngine(options).Match(Vendors(), nullptr, 0.85, 10);
  assert(report.truncated_blocks > 0);
}

} // namespace

int main() {
  TestSelfMatch();
  TestMatchingIsIdempotentAcrossWorkerLayouts();
  TestCrossMatchKeepsOrientation();
  TestCrossLimitAppliesToEachEntity();
  TestOversizeBlocksAreTruncated();

  std::cout << "fraudit_unit_matching_engine: pass\n";
  return 0;
}
