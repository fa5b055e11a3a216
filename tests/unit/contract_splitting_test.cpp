#include <cassert>
#include <iostream>

#include "internal/detection/rules/rules.hpp"
#include "tests/unit/rule_fixture.hpp"

namespace {

using fraudit::model::Severity;
using fraudit::testing::OfType;
using fraudit::testing::RuleFixture;

constexpr std::uint64_t kVendor = 1;
constexpr std::uint64_t kAgency = 900;

RuleFixture Fixture() {
  RuleFixture fixture;
  fixture.Vendor(kVendor, "Lone Star Paving LLC");
  fixture.Agency(kAgency, "Department of Transportation");
  return fixture;
}

void TestTightValuesEscalateToHigh() {
  auto fixture = Fixture();
  // 44900 sits just under the default floor
  fixture.thresholds["contract_splitting_min"] = 44000;

  fixture.Contract(kVendor, kAgency, 45000, "2024-01-10");
  fixture.Contract(kVendor, kAgency, 45200, "2024-02-10");
  fixture.Contract(kVendor, kAgency, 44900, "2024-03-10");
  fixture.Contract(kVendor, kAgency, 45100, "2024-04-10");
  fixture.Contract(kVendor, kAgency, 45050, "2024-05-10");

  auto rule     = fraudit::detection::MakeContractSplittingRule();
  auto requests = OfType(fixture.Run(*rule), "contract_splitting");
  assert(requests.size() == 1);

  const auto& request = requests[0];
  assert(request.severity == Severity::kHigh);
  assert(request.entity_id == kVendor);

  const auto& ev = request.evidence.contract_splitting();
  assert(ev.contract_count() == 5);
  assert(ev.total_value() == 225250);
  assert(ev.coefficient_of_variation() < 0.01);
  assert(ev.vendor().name() == "Lone Star Paving LLC");
  assert(ev.agency().name() == "Department of Transportation");
  assert(ev.contracts_size() == 5);
}

void TestWideSpreadOutsideRangeStaysMedium() {
  auto fixture = Fixture();

  // 42000 and 41000 fall below the reporting range, leaving three contracts
  fixture.Contract(kVendor, kAgency, 45000, "2024-01-10");
  fixture.Contract(kVendor, kAgency, 48000, "2024-02-10");
  fixture.Contract(kVendor, kAgency, 42000, "2024-03-10");
  fixture.Contract(kVendor, kAgency, 50000, "2024-04-10");
  fixture.Contract(kVendor, kAgency, 41000, "2024-05-10");

  auto rule     = fraudit::detection::MakeContractSplittingRule();
  auto requests = OfType(fixture.Run(*rule), "contract_splitting");
  assert(requests.size() == 1);
  assert(requests[0].severity == Severity::kMedium);
  assert(requests[0].evidence.contract_splitting().contract_count() == 3);
}

void TestFewerThanFiveStaysMediumDespiteLowSpread() {
  auto fixture = Fixture();
  for (const char* date : {"2024-01-05", "2024-02-05", "2024-03-05", "2024-04-05"}) {
    fixture.Contract(kVendor, kAgency, 46000, date);
  }

  auto rule     = fraudit::detection::MakeContractSplittingRule();
  auto requests = OfType(fixture.Run(*rule), "contract_splitting");
  assert(requests.size() == 1);
  assert(requests[0].severity == Severity::kMedium);
  assert(requests[0].evidence.contract_splitting().coefficient_of_variation() == 0.0);
}

void TestWindowAndCountThreshold() {
  auto fixture = Fixture();

  // outside the 12 x 30 day window before 2024-06-30
  fixture.Contract(kVendor, kAgency, 46000, "2023-01-15");
  fixture.Contract(kVendor, kAgency, 46500, "2023-02-15");
  fixture.Contract(kVendor, kAgency, 47000, "2024-02-15");
  fixture.Contract(kVendor, kAgency, 47500, "2024-03-15");

  auto rule = fraudit::detection::MakeContractSplittingRule();
  assert(OfType(fixture.Run(*rule), "contract_splitting").empty());

  // a configured count of 2 picks up the two recent ones
  fixture.thresholds["contract_splitting_count"] = 2;
  assert(OfType(fixture.Run(*rule), "contract_splitting").size() == 1);
}

void TestPostingThresholdRange() {
  auto fixture = Fixture();
  fixture.Contract(kVendor, kAgency, 24500, "2024-03-01");
  fixture.Contract(kVendor, kAgency, 24800, "2024-03-08");
  fixture.Contract(kVendor, kAgency, 24900, "2024-03-15");

  auto rule     = fraudit::detection::MakeContractSplittingRule();
  auto requests = OfType(fixture.Run(*rule), "contract_splitting");
  assert(requests.size() == 1);
  assert(requests[0].evidence.contract_splitting().range_max() == 25000);
  assert(requests[0].evidence.contract_splitting().threshold_name().find("ESBD") != std::string::npos);
}

void TestSeparateAgenciesAreSeparateGroups() {
  auto fixture = Fixture();
  fixture.Agency(901, "Health Services Commission");
  fixture.Contract(kVendor, kAgency, 46000, "2024-03-01");
  fixture.Contract(kVendor, kAgency, 46000, "2024-03-02");
  fixture.Contract(kVendor, 901, 46000, "2024-03-03");
  fixture.Contract(kVendor, 901, 46000, "2024-03-04");

  auto rule = fraudit::detection::MakeContractSplittingRule();
  assert(OfType(fixture.Run(*rule), "contract_splitting").empty());
}

} // namespace

int main() {
  TestTightValuesEscalateToHigh();
  TestWideSpreadOutsideRangeStaysMedium();
  TestFewerThanFiveStaysMediumDespiteLowSpread();
  TestWindowAndCountThreshold();
  TestPostingThresholdRange();
  TestSeparateAgenciesAreSeparateGroups();

  std::cout << "fraudit_unit_contract_splitting: pass\n";
  return 0;
}
