#include "rules.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "internal/detection/rule_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace fraudit::detection {

using fraudit::observability::IntField;

namespace {

constexpr std::size_t kListedRecipients = 10;

// All contributions made under one normalized contributor name.
struct Donor {
  const model::CanonicalEntity* representative = nullptr;
  std::uint64_t                 count          = 0;
  double                        total          = 0.0;
  std::map<std::string, double> recipients;
};

class CampaignVendorRule final : public DetectionRule {
 public:
  std::string_view Name() const override {
    return "campaign_vendor";
  }
  std::string_view DisplayName() const override {
    return "Campaign contributor vendors";
  }

  std::vector<alerts::AlertRequest> Run(const RuleContext& context) const override {
    const double min_single = context.thresholds.Get("min_contribution_amount", 500);
    const double min_total  = context.thresholds.Get("min_contribution_for_alert", 5000);
    const double threshold  = context.thresholds.Get("name_match_threshold", 0.90);

    std::vector<alerts::AlertRequest> requests;
    const auto contributors = context.dataset.ListEntities(model::EntityKind::kContributor);
    if (contributors.empty()) {
      return requests;
    }

    std::map<std::string, Donor> donors;
    for (const auto& contributor : contributors) {
      const double amount = contributor.attributes.contribution_amount.value_or(0.0);
      if (!contributor.normalized_name || amount < min_single) {
        continue;
      }
      auto& donor = donors[*contributor.normalized_name];
      if (!donor.representative) {
        donor.representative = &contributor;
      }
      ++donor.count;
      donor.total += amount;
      donor.recipients[contributor.attributes.recipient.value_or("Unknown")] += amount;
    }

    std::vector<model::CanonicalEntity>     significant;
    std::map<model::EntityId, const Donor*> by_representative;
    for (const auto& [name, donor] : donors) {
      if (donor.total >= min_total) {
        significant.push_back(*donor.representative);
        by_representative[donor.representative->id] = &donor;
      }
    }
    if (significant.empty()) {
      return requests;
    }

    const auto vendor_list = context.dataset.ListEntities(model::EntityKind::kVendor);
    const auto vendors     = IndexById(vendor_list);
    const auto payments    = SummarizeVendorPayments(context.dataset.ListPayments());

    std::map<model::EntityId, double> contract_totals;
    for (const auto& contract : context.dataset.ListContracts()) {
      if (contract.vendor_id != 0) {
        contract_totals[contract.vendor_id] += contract.value;
      }
    }

    const auto report = context.matcher.Match(significant, &vendor_list, threshold, context.max_candidates_per_item);
    for (const auto& pair : report.pairs) {
      auto        donor  = by_representative.find(pair.id_1);
      const auto* vendor = Lookup(vendors, pair.id_2);
      if (donor == by_representative.end() || !vendor) {
        continue;
      }
      const auto& giver = *donor->second;

      double vendor_payments = 0.0;
      if (auto paid = payments.find(vendor->id); paid != payments.end()) {
        vendor_payments = paid->second.total;
      }
      double vendor_contracts = 0.0;
      if (auto held = contract_totals.find(vendor->id); held != contract_totals.end()) {
        vendor_contracts = held->second;
      }
      const double business = vendor_payments + vendor_contracts;
      const double ratio    = giver.total > 0.0 ? business / giver.total : 0.0;

      std::vector<std::pair<std::string, double>> ranked(giver.recipients.begin(), giver.recipients.end());
      std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) { return a.second > b.second; });

      const auto& name = *giver.representative->normalized_name;

      alerts::AlertRequest request;
      request.alert_type = "pay_to_play";
      request.severity   = model::Severity::kLow;
      if (ratio > 10) {
        request.severity = model::Severity::kMedium;
      }
      if (ratio > 100) {
        request.severity = model::Severity::kHigh;
      }
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = vendor->id;
      request.title       = "Campaign contributor is state vendor: " + util::Truncate(vendor->display_name, 30);
      request.description = "Campaign contributor '" + giver.representative->display_name + "' (" + util::FormatMoney(giver.total) +
                            " donated) matches vendor '" + vendor->display_name + "' (" + util::FormatMoney(business) +
                            " in state business). Return ratio: " + fmt::format("{:.1f}x", ratio) + ".";

      auto* ev = request.evidence.mutable_pay_to_play();
      *ev->mutable_vendor() = MakeRef(*vendor);
      ev->set_contributor_name(name);
      ev->set_match_score(pair.score);
      ev->set_contribution_count(giver.count);
      ev->set_total_contributions(giver.total);
      for (std::size_t i = 0; i < ranked.size() && i < kListedRecipients; ++i) {
        auto* recipient = ev->add_recipients();
        recipient->set_name(ranked[i].first);
        recipient->set_amount(ranked[i].second);
      }
      ev->set_vendor_payments(vendor_payments);
      ev->set_vendor_contracts(vendor_contracts);
      ev->set_return_ratio(Round(ratio, 2));
      requests.push_back(std::move(request));
    }

    FRAUDIT_LOG_DEBUG("campaign contributor screen", {IntField("donors", static_cast<std::int64_t>(significant.size())),
                                                      IntField("matches", static_cast<std::int64_t>(report.pairs.size()))});
    return requests;
  }
};

} // namespace

std::unique_ptr<DetectionRule> MakeCampaignVendorRule() {
  return std::make_unique<CampaignVendorRule>();
}

} // namespace fraudit::detection
