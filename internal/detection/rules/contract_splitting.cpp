#include "rules.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "internal/detection/rule_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace fraudit::detection {

using fraudit::observability::DoubleField;
using fraudit::observability::IntField;
using fraudit::observability::StringField;

namespace {

constexpr double kEsbdMin = 22000.0;
// a century of look-back is more than any dataset covers
constexpr std::size_t kMaxMonths = 1200;

struct ThresholdRange {
  std::string name;
  double      min = 0.0;
  double      max = 0.0;
};

class ContractSplittingRule final : public DetectionRule {
 public:
  std::string_view Name() const override {
    return "contract_splitting";
  }
  std::string_view DisplayName() const override {
    return "Contract splitting";
  }

  std::vector<alerts::AlertRequest> Run(const RuleContext& context) const override {
    const auto& th         = context.thresholds;
    const auto  count_min  = th.GetCount("contract_splitting_count", 3);
    const auto  months     = static_cast<int>(th.GetCount("contract_splitting_months", 12, kMaxMonths));
    const auto  cutoff     = util::AddDays(context.as_of, -months * 30);
    const auto  contracts  = context.dataset.ListContracts();
    const auto  vendors    = IndexById(context.dataset.ListEntities(model::EntityKind::kVendor));
    const auto  agencies   = IndexById(context.dataset.ListEntities(model::EntityKind::kAgency));

    const std::vector<ThresholdRange> ranges = {
        {"LBB reporting threshold ($50K)", th.Get("contract_splitting_min", 45000), th.Get("contract_splitting_max", 50000)},
        {"ESBD posting threshold ($25K)", kEsbdMin, th.Get("esbd_threshold", 25000)},
    };

    std::vector<alerts::AlertRequest> requests;
    for (const auto& range : ranges) {
      CheckRange(range, contracts, cutoff, count_min, months, vendors, agencies, requests);
    }
    return requests;
  }

 private:
  static void CheckRange(const ThresholdRange& range, const std::vector<model::ContractRecord>& contracts, const util::Date& cutoff,
                         std::size_t count_min, int months, const EntityIndex& vendors, const EntityIndex& agencies,
                         std::vector<alerts::AlertRequest>& requests) {
    std::map<std::pair<model::EntityId, model::EntityId>, std::vector<const model::ContractRecord*>> groups;
    for (const auto& contract : contracts) {
      if (contract.vendor_id == 0) {
        continue;
      }
      if (contract.value < range.min || contract.value > range.max) {
        continue;
      }
      if (contract.start_date < cutoff) {
        continue;
      }
      groups[{contract.vendor_id, contract.agency_id}].push_back(&contract);
    }

    for (const auto& [key, group] : groups) {
      if (group.size() < count_min) {
        continue;
      }

      const auto* vendor = Lookup(vendors, key.first);
      if (!vendor) {
        FRAUDIT_LOG_DEBUG("contract group vendor missing", {IntField("vendor_id", static_cast<std::int64_t>(key.first))});
        continue;
      }
      const auto* agency = Lookup(agencies, key.second);

      std::vector<double> values;
      values.reserve(group.size());
      double total = 0.0;
      for (const auto* contract : group) {
        values.push_back(contract->value);
        total += contract->value;
      }
      const double cv = CoefficientOfVariation(values);

      alerts::AlertRequest request;
      request.alert_type  = "contract_splitting";
      request.severity    = model::Severity::kMedium;
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = vendor->id;
      if (cv < 0.1 && group.size() >= 5) {
        request.severity = model::Severity::kHigh;
      }

      auto* ev = request.evidence.mutable_contract_splitting();
      *ev->mutable_vendor() = MakeRef(*vendor);
      *ev->mutable_agency() = agency ? MakeRef(*agency) : MakeRef(key.second);
      ev->set_threshold_name(range.name);
      ev->set_range_min(range.min);
      ev->set_range_max(range.max);
      ev->set_contract_count(static_cast<std::uint32_t>(group.size()));
      ev->set_total_value(total);
      ev->set_average_value(Mean(values));
      ev->set_coefficient_of_variation(Round(cv, 3));
      for (const auto* contract : group) {
        auto* line = ev->add_contracts();
        line->set_id(contract->id);
        line->set_number(contract->contract_number);
        line->set_value(contract->value);
        line->set_start_date(util::FormatDate(contract->start_date));
        line->set_description(util::Truncate(contract->description, 100));
      }

      const std::string agency_part = agency ? " with " + agency->display_name : "";
      request.title                 = "Potential contract splitting: " + vendor->display_name;
      request.description = "Vendor '" + vendor->display_name + "' has " + std::to_string(group.size()) + " contracts in the " +
                            util::FormatMoney(range.min) + "-" + util::FormatMoney(range.max) + " range" + agency_part +
                            " within the past " + std::to_string(months) + " months. Total value: " + util::FormatMoney(total) +
                            ". This pattern may indicate intentional splitting to avoid the " + range.name + ".";

      FRAUDIT_LOG_DEBUG("contract splitting group", {StringField("range", range.name), IntField("vendor_id", static_cast<std::int64_t>(vendor->id)),
                                                     IntField("contracts", static_cast<std::int64_t>(group.size())), DoubleField("cv", cv)});
      requests.push_back(std::move(request));
    }
  }
};

} // namespace

std::unique_ptr<DetectionRule> MakeContractSplittingRule() {
  return std::make_unique<ContractSplittingRule>();
}

} // namespace fraudit::detection
