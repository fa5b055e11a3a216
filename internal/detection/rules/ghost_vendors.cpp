#include "rules.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/detection/rule_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace fraudit::detection {

using fraudit::observability::IntField;

namespace {

constexpr std::array<std::string_view, 11> kSuspiciousPatterns = {
    "po box", "p.o. box", "p o box", "pmb", "suite 0", "apt 0", "unit 0", "unknown", "n/a", "none", "general delivery",
};

bool Blank(const std::optional<std::string>& value) {
  return !value || util::CollapseWhitespace(*value).empty();
}

class GhostVendorsRule final : public DetectionRule {
 public:
  std::string_view Name() const override {
    return "ghost_vendors";
  }
  std::string_view DisplayName() const override {
    return "Ghost vendors";
  }

  std::vector<alerts::AlertRequest> Run(const RuleContext& context) const override {
    const double min_payment = context.thresholds.Get("ghost_vendor_min_payment", 25000);
    const auto   payments    = SummarizeVendorPayments(context.dataset.ListPayments());

    std::vector<alerts::AlertRequest> requests;
    std::size_t                       checked = 0;
    for (const auto& vendor : context.dataset.ListEntities(model::EntityKind::kVendor)) {
      auto paid = payments.find(vendor.id);
      if (paid == payments.end() || paid->second.total < min_payment) {
        continue;
      }
      ++checked;

      if (!vendor.attributes.registered.value_or(false)) {
        Unregistered(vendor, paid->second, requests);
      } else {
        IncompleteAddress(vendor, paid->second, requests);
      }
      SuspiciousAddress(vendor, paid->second, requests);
    }

    FRAUDIT_LOG_DEBUG("ghost vendor screen", {IntField("vendors", static_cast<std::int64_t>(checked))});
    return requests;
  }

 private:
  static void FillCommon(evidence::GhostVendorEvidence* ev, const model::CanonicalEntity& vendor, const PaymentSummary& summary) {
    *ev->mutable_vendor() = MakeRef(vendor);
    ev->set_in_cmbl(vendor.attributes.registered.value_or(false));
    ev->set_total_payments(summary.total);
    ev->set_payment_count(summary.count);
    ev->set_agency_count(summary.agencies.size());
    if (summary.first) ev->set_first_payment(util::FormatDate(*summary.first));
    if (summary.last) ev->set_last_payment(util::FormatDate(*summary.last));
  }

  static void Unregistered(const model::CanonicalEntity& vendor, const PaymentSummary& summary, std::vector<alerts::AlertRequest>& requests) {
    const auto& attrs = vendor.attributes;

    std::vector<std::string> flags;
    if (Blank(attrs.external_id)) {
      flags.emplace_back("No state vendor ID");
    }
    if (Blank(attrs.street) || Blank(attrs.city) || Blank(attrs.state)) {
      flags.emplace_back("Incomplete address");
    }
    if (Blank(attrs.phone)) {
      flags.emplace_back("No phone number");
    }
    if (summary.agencies.size() >= 3) {
      flags.push_back("Payments from " + std::to_string(summary.agencies.size()) + " different agencies");
    }

    alerts::AlertRequest request;
    request.alert_type  = "ghost_vendor";
    request.severity    = (summary.total >= 500000 || flags.size() >= 3) ? model::Severity::kHigh : model::Severity::kMedium;
    request.entity_kind = model::EntityKind::kVendor;
    request.entity_id   = vendor.id;
    request.title       = "Vendor not in CMBL: " + vendor.display_name;
    request.description = "Vendor '" + vendor.display_name + "' received " + util::FormatMoney(summary.total) + " in " +
                          std::to_string(summary.count) +
                          " payments but is not registered in the Centralized Master Bidders List. Red flags: " +
                          (flags.empty() ? std::string("None") : JoinStrings(flags, ", ")) + ".";

    auto* ev = request.evidence.mutable_ghost_vendor();
    FillCommon(ev, vendor, summary);
    for (const auto& flag : flags) {
      ev->add_red_flags(flag);
    }
    requests.push_back(std::move(request));
  }

  static void IncompleteAddress(const model::CanonicalEntity& vendor, const PaymentSummary& summary,
                                std::vector<alerts::AlertRequest>& requests) {
    const auto& attrs        = vendor.attributes;
    const bool  short_street = Blank(attrs.street) || attrs.street->size() < 5;
    if (!short_street && !Blank(attrs.city) && !Blank(attrs.state)) {
      return;
    }

    std::vector<std::string> missing;
    if (short_street) missing.emplace_back("street address");
    if (Blank(attrs.city)) missing.emplace_back("city");
    if (Blank(attrs.state)) missing.emplace_back("state");
    if (Blank(attrs.zip_code)) missing.emplace_back("ZIP code");

    alerts::AlertRequest request;
    request.alert_type  = "incomplete_vendor_address";
    request.severity    = (summary.total >= 100000 || missing.size() >= 3) ? model::Severity::kHigh : model::Severity::kMedium;
    request.entity_kind = model::EntityKind::kVendor;
    request.entity_id   = vendor.id;
    request.title       = "Incomplete vendor address: " + vendor.display_name;
    request.description = "Vendor '" + vendor.display_name + "' received " + util::FormatMoney(summary.total) +
                          " with an incomplete address on file. Missing: " + JoinStrings(missing, ", ") + ".";

    auto* ev = request.evidence.mutable_ghost_vendor();
    FillCommon(ev, vendor, summary);
    for (const auto& field : missing) {
      ev->add_missing_fields(field);
    }
    requests.push_back(std::move(request));
  }

  static void SuspiciousAddress(const model::CanonicalEntity& vendor, const PaymentSummary& summary,
                                std::vector<alerts::AlertRequest>& requests) {
    if (Blank(vendor.attributes.street)) {
      return;
    }
    const auto& street = *vendor.attributes.street;
    const auto  lower  = util::ToLower(street);

    std::vector<std::string> patterns;
    for (auto pattern : kSuspiciousPatterns) {
      if (util::Contains(lower, pattern)) {
        patterns.emplace_back(pattern);
      }
    }
    if (patterns.empty()) {
      return;
    }

    std::vector<std::string> flags = patterns;
    bool                     box   = false;
    for (const auto& pattern : patterns) {
      box = box || util::Contains(pattern, "box");
    }
    if (box && summary.total >= 250000) {
      flags.emplace_back("Large payments to PO Box address");
    }
    if (street.size() < 10) {
      flags.emplace_back("Very short address");
    }

    alerts::AlertRequest request;
    request.alert_type = "suspicious_vendor_address";
    request.severity   = model::Severity::kLow;
    if (summary.total >= 100000) {
      request.severity = model::Severity::kMedium;
    }
    if (summary.total >= 500000 || flags.size() >= 3) {
      request.severity = model::Severity::kHigh;
    }
    request.entity_kind = model::EntityKind::kVendor;
    request.entity_id   = vendor.id;
    request.title       = "Suspicious vendor address: " + vendor.display_name;
    request.description = "Vendor '" + vendor.display_name + "' at '" + street + "' received " + util::FormatMoney(summary.total) +
                          ". Patterns found: " + JoinStrings(patterns, ", ") + ".";

    auto* ev = request.evidence.mutable_ghost_vendor();
    FillCommon(ev, vendor, summary);
    for (const auto& flag : flags) {
      ev->add_red_flags(flag);
    }
    requests.push_back(std::move(request));
  }
};

} // namespace

std::unique_ptr<DetectionRule> MakeGhostVendorsRule() {
  return std::make_unique<GhostVendorsRule>();
}

} // namespace fraudit::detection
