#include "registry.hpp"

#include <array>
#include <utility>

#include "internal/detection/rules/rules.hpp"
#include "internal/util/errors.hpp"

namespace fraudit::detection {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 13> kAliases = {{
    {"contract-splitting", "contract_splitting"},
    {"vendor-clustering", "vendor_clustering"},
    {"network-analysis", "network"},
    {"employee-vendor", "employee_vendor"},
    {"related-party", "related_party"},
    {"debarment", "debarment"},
    {"sam-exclusions", "debarment"},
    {"fiscal-year-rush", "fiscal_year_rush"},
    {"ghost-vendors", "ghost_vendors"},
    {"duplicate-payments", "duplicates"},
    {"payment-anomalies", "anomalies"},
    {"campaign-vendor", "campaign_vendor"},
    {"pay-to-play", "campaign_vendor"},
}};

} // namespace

std::string CanonicalRuleName(std::string_view name) {
  for (const auto& [alias, canonical] : kAliases) {
    if (alias == name) {
      return std::string(canonical);
    }
  }
  return std::string(name);
}

void RuleRegistry::Add(std::shared_ptr<const DetectionRule> rule) {
  if (!rule) {
    throw util::ValidationError("cannot register a null rule");
  }
  for (const auto& existing : rules_) {
    if (existing->Name() == rule->Name()) {
      throw util::AlreadyExists("rule already registered: " + std::string(rule->Name()));
    }
  }
  rules_.push_back(std::move(rule));
}

std::shared_ptr<const DetectionRule> RuleRegistry::Find(std::string_view name) const {
  const auto canonical = CanonicalRuleName(name);
  for (const auto& rule : rules_) {
    if (rule->Name() == canonical) {
      return rule;
    }
  }
  return nullptr;
}

RuleRegistry RuleRegistry::Subset(const std::vector<std::string>& names) const {
  std::vector<std::string> wanted;
  for (const auto& name : names) {
    if (!Find(name)) {
      throw util::NotFound("unknown rule: " + name);
    }
    wanted.push_back(CanonicalRuleName(name));
  }

  RuleRegistry subset;
  for (const auto& rule : rules_) {
    for (const auto& name : wanted) {
      if (rule->Name() == name) {
        subset.rules_.push_back(rule);
        break;
      }
    }
  }
  return subset;
}

RuleRegistry RuleRegistry::Default() {
  RuleRegistry registry;
  registry.Add(MakeContractSplittingRule());
  registry.Add(MakeDuplicatesRule());
  registry.Add(MakeVendorClusteringRule());
  registry.Add(MakeAnomaliesRule());
  registry.Add(MakeNetworkRule());
  registry.Add(MakeCampaignVendorRule());
  registry.Add(MakeEmployeeVendorRule());
  registry.Add(MakeRelatedPartyRule());
  registry.Add(MakeDebarmentRule());
  registry.Add(MakeFiscalYearRushRule());
  registry.Add(MakeGhostVendorsRule());
  return registry;
}

} // namespace fraudit::detection
