#include "rules.hpp"

#include <map>
#include <string>
#include <vector>

#include "internal/detection/rule_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace fraudit::detection {

using fraudit::observability::IntField;

namespace {

constexpr double kAddressScore = 0.85;

struct ExclusionMatch {
  const model::CanonicalEntity* exclusion = nullptr;
  std::string                   match_type;
  double                        score = 0.0;
};

class DebarmentRule final : public DetectionRule {
 public:
  std::string_view Name() const override {
    return "debarment";
  }
  std::string_view DisplayName() const override {
    return "Debarment check";
  }

  std::vector<alerts::AlertRequest> Run(const RuleContext& context) const override {
    std::vector<alerts::AlertRequest> requests;

    std::vector<model::CanonicalEntity> exclusions;
    for (auto& entity : context.dataset.ListEntities(model::EntityKind::kDebarred)) {
      if (entity.attributes.active.value_or(true)) {
        exclusions.push_back(std::move(entity));
      }
    }
    if (exclusions.empty()) {
      FRAUDIT_LOG_INFO("no active exclusions loaded");
      return requests;
    }

    const double min_payment = context.thresholds.Get("debarment_min_payment", 1000);
    const double threshold   = context.thresholds.Get("debarment_name_similarity", 0.90);
    const auto   payments    = SummarizeVendorPayments(context.dataset.ListPayments());

    std::vector<model::CanonicalEntity> vendors;
    for (auto& vendor : context.dataset.ListEntities(model::EntityKind::kVendor)) {
      auto paid = payments.find(vendor.id);
      if (paid != payments.end() && paid->second.total >= min_payment) {
        vendors.push_back(std::move(vendor));
      }
    }
    FRAUDIT_LOG_DEBUG("checking vendors against exclusions", {IntField("vendors", static_cast<std::int64_t>(vendors.size())),
                                                              IntField("exclusions", static_cast<std::int64_t>(exclusions.size()))});
    if (vendors.empty()) {
      return requests;
    }

    std::map<std::string, std::vector<const model::CanonicalEntity*>> by_name;
    std::map<std::string, std::vector<const model::CanonicalEntity*>> by_address;
    for (const auto& exclusion : exclusions) {
      if (exclusion.normalized_name) {
        by_name[*exclusion.normalized_name].push_back(&exclusion);
      }
      if (exclusion.normalized_address) {
        by_address[*exclusion.normalized_address].push_back(&exclusion);
      }
    }

    const auto exclusion_index = IndexById(exclusions);
    std::map<model::EntityId, std::vector<ExclusionMatch>> matches;

    // exact names first; fuzzy candidates only count for vendors without one
    for (const auto& vendor : vendors) {
      if (!vendor.normalized_name) {
        continue;
      }
      if (auto it = by_name.find(*vendor.normalized_name); it != by_name.end()) {
        for (const auto* exclusion : it->second) {
          matches[vendor.id].push_back({exclusion, "exact_name", 1.0});
        }
      }
    }

    const auto report = context.matcher.Match(vendors, &exclusions, threshold, context.max_candidates_per_item);
    for (const auto& pair : report.pairs) {
      auto& found = matches[pair.id_1];
      bool  exact = false;
      for (const auto& m : found) {
        exact = exact || m.match_type == "exact_name";
      }
      if (exact) {
        continue;
      }
      if (const auto* exclusion = Lookup(exclusion_index, pair.id_2)) {
        found.push_back({exclusion, "fuzzy_name", pair.score});
      }
    }

    for (const auto& vendor : vendors) {
      if (!vendor.normalized_address) {
        continue;
      }
      auto it = by_address.find(*vendor.normalized_address);
      if (it == by_address.end()) {
        continue;
      }
      auto& found = matches[vendor.id];
      for (const auto* exclusion : it->second) {
        bool already = false;
        for (const auto& m : found) {
          already = already || m.exclusion->id == exclusion->id;
        }
        if (!already) {
          found.push_back({exclusion, "address", kAddressScore});
        }
      }
    }

    std::vector<model::RelationshipEdge> edges;
    for (const auto& vendor : vendors) {
      auto it = matches.find(vendor.id);
      if (it == matches.end() || it->second.empty()) {
        continue;
      }

      const ExclusionMatch* best = nullptr;
      for (const auto& m : it->second) {
        evidence::RelationshipEvidence rel;
        rel.set_method(m.match_type);
        rel.set_name_1(vendor.display_name);
        rel.set_name_2(m.exclusion->display_name);
        rel.set_similarity(Round(m.score, 4));
        rel.set_external_2(m.exclusion->attributes.external_id.value_or(""));
        edges.push_back(MakeEdge(model::EntityKind::kVendor, vendor.id, model::EntityKind::kDebarred, m.exclusion->id,
                                 model::relation::kDebarment, m.score, rel));

        if (!best || m.score > best->score || (m.score == best->score && m.exclusion->id < best->exclusion->id)) {
          best = &m;
        }
      }

      const auto& summary = payments.at(vendor.id);

      alerts::AlertRequest request;
      request.alert_type = "debarred_vendor";
      if (best->match_type == "exact_name" || best->score >= 0.95) {
        request.severity = model::Severity::kHigh;
      } else if (best->score >= 0.90) {
        request.severity = model::Severity::kMedium;
      } else {
        request.severity = model::Severity::kLow;
      }
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = vendor.id;
      request.title       = "Vendor matches excluded entity: " + util::Truncate(best->exclusion->display_name, 50);

      std::string match_words = best->match_type;
      for (auto& c : match_words) {
        if (c == '_') c = ' ';
      }
      request.description = "Vendor '" + vendor.display_name + "' matches " + match_words + " with excluded entity '" +
                            best->exclusion->display_name + "' (" + best->exclusion->attributes.external_id.value_or("N/A") +
                            "). Total payments: " + util::FormatMoney(summary.total);

      auto* ev = request.evidence.mutable_debarment();
      *ev->mutable_vendor()    = MakeRef(vendor);
      *ev->mutable_exclusion() = MakeRef(*best->exclusion);
      ev->set_match_type(best->match_type);
      ev->set_match_score(Round(best->score, 4));
      ev->set_payment_total(summary.total);
      ev->set_payment_count(summary.count);
      requests.push_back(std::move(request));
    }

    context.relationships.UpsertAll(edges);
    return requests;
  }
};

} // namespace

std::unique_ptr<DetectionRule> MakeDebarmentRule() {
  return std::make_unique<DebarmentRule>();
}

} // namespace fraudit::detection
