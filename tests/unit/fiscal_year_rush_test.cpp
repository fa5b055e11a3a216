#include <cassert>
#include <iostream>
#include <string>

#include "internal/detection/rules/rules.hpp"
#include "tests/unit/rule_fixture.hpp"

namespace {

using fraudit::model::Severity;
using fraudit::testing::Find;
using fraudit::testing::OfType;
using fraudit::testing::RuleFixture;

// as_of 2024-06-30 falls in FY2024, so FY2019..FY2023 are examined.
RuleFixture Fixture() {
  RuleFixture fixture;
  fixture.Agency(900, "Department of Transportation");
  fixture.Agency(901, "Health Services Commission");
  fixture.Agency(903, "Historical Commission");
  fixture.Agency(904, "Lottery Commission");
  fixture.Vendor(1, "Lone Star Paving LLC");
  fixture.Vendor(2, "Year End Supply Co");
  fixture.Vendor(3, "Steady Services Inc");
  fixture.Vendor(4, "Summer Only Vendor");

  // FY2023: ten ordinary months, then a July bump and a large last-week payment
  for (const char* date : {"2022-09-15", "2022-10-15", "2022-11-15", "2022-12-15", "2023-01-15", "2023-02-15", "2023-03-15",
                           "2023-04-15", "2023-05-15", "2023-06-15"}) {
    fixture.Pay(1, 900, 10000, date);
  }
  fixture.Pay(1, 900, 20000, "2023-07-15");
  fixture.Pay(2, 900, 150000, "2023-08-28");

  // steady spender all year
  for (const char* date : {"2022-09-20", "2022-10-20", "2022-11-20", "2022-12-20", "2023-01-20", "2023-02-20", "2023-03-20",
                           "2023-04-20", "2023-05-20", "2023-06-20", "2023-07-20", "2023-08-20"}) {
    fixture.Pay(3, 901, 10000, date);
  }

  // FY2018 is outside every window
  fixture.Pay(2, 903, 200000, "2018-08-28");
  // FY2020 is outside the vendor concentration window
  fixture.Pay(4, 904, 60000, "2020-08-10");
  // FY2024 is still in progress
  fixture.Pay(2, 901, 500000, "2024-06-01");
  return fixture;
}

void TestAgencySpendingRush() {
  auto fixture  = Fixture();
  auto rule     = fraudit::detection::MakeFiscalYearRushRule();
  auto requests = fixture.Run(*rule);

  auto rushes = OfType(requests, "fiscal_year_spending_rush");
  assert(rushes.size() == 1);

  const auto& rush = rushes[0];
  assert(rush.entity_id == 900);
  assert(rush.severity == Severity::kHigh);
  assert(rush.title.find("FY2023") != std::string::npos);

  const auto& ev = rush.evidence.fiscal_year_spike();
  assert(ev.fiscal_year() == 2023);
  assert(ev.fy_total() == 270000);
  assert(ev.final_months_total() == 170000);
  assert(ev.monthly_average() == 10000);
  assert(ev.july_total() == 20000);
  assert(ev.august_total() == 150000);
  assert(ev.august_ratio() == 15.0);
  assert(ev.payment_count() == 12);
}

void TestVendorYearEndConcentration() {
  auto fixture  = Fixture();
  auto rule     = fraudit::detection::MakeFiscalYearRushRule();
  auto requests = fixture.Run(*rule);

  auto concentrated = OfType(requests, "vendor_fy_end_concentration");
  assert(concentrated.size() == 1);
  assert(concentrated[0].entity_id == 2);
  assert(concentrated[0].severity == Severity::kHigh);
  assert(concentrated[0].evidence.vendor_concentration().final_months_percentage() == 100.0);
  assert(concentrated[0].evidence.vendor_concentration().fiscal_year() == 2023);

  assert(Find(requests, "vendor_fy_end_concentration", 4) == nullptr);

  // at a 15% share the two vendors with a sixth of their FY2023 total in Jul/Aug also qualify
  fixture.thresholds["fy_end_vendor_concentration"] = 0.15;
  auto relaxed = OfType(fixture.Run(*rule), "vendor_fy_end_concentration");
  assert(relaxed.size() == 3);
}

void TestFinalDaysCluster() {
  auto fixture  = Fixture();
  auto rule     = fraudit::detection::MakeFiscalYearRushRule();
  auto requests = fixture.Run(*rule);

  auto clusters = OfType(requests, "fy_end_payment_cluster");
  assert(clusters.size() == 1);
  assert(clusters[0].entity_id == 900);
  assert(clusters[0].severity == Severity::kMedium);

  const auto& ev = clusters[0].evidence.payment_cluster();
  assert(ev.final_days_total() == 150000);
  assert(ev.payment_count() == 1);
  assert(ev.date_range() == "2023-08-27 to 2023-08-31");
  assert(ev.top_vendors_size() == 1);
  assert(ev.top_vendors(0).vendor().id() == 2);
}

void TestNothingOutsideTheWindows() {
  auto fixture  = Fixture();
  auto rule     = fraudit::detection::MakeFiscalYearRushRule();
  auto requests = fixture.Run(*rule);

  for (const auto& request : requests) {
    assert(request.entity_id != 903);
    assert(request.entity_id != 904);
    assert(request.entity_id != 901);
  }
}

} // namespace

int main() {
  TestAgencySpendingRush();
  TestVendorYearEndConcentration();
  TestFinalDaysCluster();
  TestNothingOutsideTheWindows();

  std::cout << "fraudit_unit_fiscal_year_rush: pass\n";
  return 0;
}
