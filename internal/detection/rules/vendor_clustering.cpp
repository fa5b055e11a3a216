#include "rules.hpp"

#include <algorithm>
#include <charconv>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/detection/rule_support.hpp"
#include "internal/match/similarity.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace fraudit::detection {

using fraudit::observability::IntField;

namespace {

constexpr double kSameAddressConfidence = 0.8;
constexpr double kDuplicateNameCutoff   = 0.9;
constexpr double kNameAlertSimilarity   = 0.9;
constexpr double kSequentialEdgeMin     = 0.7;
constexpr double kSequentialAlertMin    = 0.85;

using VendorGroup = std::vector<const model::CanonicalEntity*>;

// Vendor number with dashes and spaces removed, when what is left is numeric.
std::optional<std::uint64_t> NumericVendorNumber(const model::CanonicalEntity& vendor) {
  if (!vendor.attributes.external_id) {
    return std::nullopt;
  }
  std::string digits;
  for (char c : *vendor.attributes.external_id) {
    if (c == '-' || c == ' ') {
      continue;
    }
    digits.push_back(c);
  }
  if (digits.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  auto [end, ec]      = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc() || end != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

class VendorClusteringRule final : public DetectionRule {
 public:
  std::string_view Name() const override {
    return "vendor_clustering";
  }
  std::string_view DisplayName() const override {
    return "Vendor clustering";
  }

  std::vector<alerts::AlertRequest> Run(const RuleContext& context) const override {
    const auto vendors  = context.dataset.ListEntities(model::EntityKind::kVendor);
    const auto payments = SummarizeVendorPayments(context.dataset.ListPayments());

    std::vector<alerts::AlertRequest> requests;
    SameAddress(context, vendors, payments, requests);
    SimilarNames(context, vendors, requests);
    SequentialIds(context, vendors, requests);
    return requests;
  }

 private:
  static void SameAddress(const RuleContext& context, const std::vector<model::CanonicalEntity>& vendors,
                          const std::unordered_map<model::EntityId, PaymentSummary>& payments,
                          std::vector<alerts::AlertRequest>& requests) {
    std::map<std::string, VendorGroup> groups;
    for (const auto& vendor : vendors) {
      if (vendor.normalized_address) {
        groups[*vendor.normalized_address].push_back(&vendor);
      }
    }

    std::vector<model::RelationshipEdge> edges;
    for (const auto& [address, group] : groups) {
      if (group.size() < 2) {
        continue;
      }
      // two near-identical names at one address are most likely one vendor
      if (group.size() == 2 && match::Similarity(NameOf(*group[0]), NameOf(*group[1])) > kDuplicateNameCutoff) {
        continue;
      }

      for (std::size_t i = 0; i < group.size(); ++i) {
        for (std::size_t j = i + 1; j < group.size(); ++j) {
          evidence::RelationshipEvidence ev;
          ev.set_method(std::string(model::relation::kSameAddress));
          ev.set_name_1(group[i]->display_name);
          ev.set_name_2(group[j]->display_name);
          ev.set_address(address);
          edges.push_back(MakeEdge(model::EntityKind::kVendor, group[i]->id, model::EntityKind::kVendor, group[j]->id,
                                   model::relation::kSameAddress, kSameAddressConfidence, ev));
        }
      }

      if (group.size() < 3) {
        continue;
      }

      double total = 0.0;
      for (const auto* vendor : group) {
        if (auto it = payments.find(vendor->id); it != payments.end()) {
          total += it->second.total;
        }
      }

      alerts::AlertRequest request;
      request.alert_type  = "vendor_cluster_address";
      request.severity    = (group.size() >= 5 || total >= 1000000) ? model::Severity::kHigh : model::Severity::kMedium;
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = group.front()->id;
      request.title       = "Multiple vendors at same address (" + std::to_string(group.size()) + " vendors)";
      request.description = std::to_string(group.size()) + " different vendors share the address '" + address +
                            "'. Combined payments: " + util::FormatMoney(total) +
                            ". This may indicate shell companies or related entities.";

      auto* ev = request.evidence.mutable_address_cluster();
      ev->set_address(address);
      ev->set_total_payments(total);
      for (const auto* vendor : group) {
        *ev->add_vendors() = MakeRef(*vendor);
      }
      requests.push_back(std::move(request));
    }

    auto summary = context.relationships.UpsertAll(edges);
    FRAUDIT_LOG_DEBUG("same address edges", {IntField("inserted", static_cast<std::int64_t>(summary.inserted)),
                                             IntField("updated", static_cast<std::int64_t>(summary.updated))});
  }

  static void SimilarNames(const RuleContext& context, const std::vector<model::CanonicalEntity>& vendors,
                           std::vector<alerts::AlertRequest>& requests) {
    const double threshold = context.thresholds.Get("vendor_name_similarity", 0.85);
    const auto   report    = context.matcher.Match(vendors, nullptr, threshold, context.max_candidates_per_item);
    const auto   index     = IndexById(vendors);

    std::vector<model::RelationshipEdge> edges;
    for (const auto& pair : report.pairs) {
      const auto* v1 = Lookup(index, pair.id_1);
      const auto* v2 = Lookup(index, pair.id_2);
      if (!v1 || !v2) {
        continue;
      }

      evidence::RelationshipEvidence rel;
      rel.set_method(std::string(model::relation::kSimilarName));
      rel.set_name_1(v1->display_name);
      rel.set_name_2(v2->display_name);
      rel.set_similarity(Round(pair.score, 4));
      edges.push_back(MakeEdge(model::EntityKind::kVendor, v1->id, model::EntityKind::kVendor, v2->id, model::relation::kSimilarName,
                               pair.score, rel));

      if (pair.score < kNameAlertSimilarity) {
        continue;
      }
      // same name, different known addresses
      if (!v1->normalized_address || !v2->normalized_address || *v1->normalized_address == *v2->normalized_address) {
        continue;
      }

      alerts::AlertRequest request;
      request.alert_type  = "vendor_cluster_name";
      request.severity    = model::Severity::kMedium;
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = v1->id;
      request.title       = "Similar vendor names: " + v1->display_name + " / " + v2->display_name;
      request.description = "Vendors '" + v1->display_name + "' and '" + v2->display_name + "' have " + Percent(pair.score) +
                            " name similarity but different addresses. This may indicate duplicate registrations or shell companies.";

      auto* ev = request.evidence.mutable_similar_vendor();
      *ev->mutable_vendor_1() = MakeRef(*v1);
      *ev->mutable_vendor_2() = MakeRef(*v2);
      ev->set_similarity(Round(pair.score, 4));
      ev->set_method(std::string(model::relation::kSimilarName));
      requests.push_back(std::move(request));
    }

    context.relationships.UpsertAll(edges);
    if (report.failed_batches > 0) {
      FRAUDIT_LOG_WARN("vendor name matching incomplete", {IntField("failed_batches", static_cast<std::int64_t>(report.failed_batches))});
    }
  }

  static void SequentialIds(const RuleContext& context, const std::vector<model::CanonicalEntity>& vendors,
                            std::vector<alerts::AlertRequest>& requests) {
    std::vector<std::pair<std::uint64_t, const model::CanonicalEntity*>> numbered;
    for (const auto& vendor : vendors) {
      if (auto number = NumericVendorNumber(vendor)) {
        numbered.emplace_back(*number, &vendor);
      }
    }
    std::sort(numbered.begin(), numbered.end(), [](const auto& a, const auto& b) {
      if (a.first != b.first) return a.first < b.first;
      return a.second->id < b.second->id;
    });

    std::vector<model::RelationshipEdge> edges;
    for (std::size_t i = 0; i + 1 < numbered.size(); ++i) {
      if (numbered[i + 1].first - numbered[i].first != 1) {
        continue;
      }
      const auto* v1 = numbered[i].second;
      const auto* v2 = numbered[i + 1].second;
      if (v1->id == v2->id) {
        continue;
      }

      const double similarity = match::Similarity(NameOf(*v1), NameOf(*v2));
      if (similarity < kSequentialEdgeMin) {
        continue;
      }

      evidence::RelationshipEvidence rel;
      rel.set_method(std::string(model::relation::kSequentialId));
      rel.set_name_1(v1->display_name);
      rel.set_name_2(v2->display_name);
      rel.set_similarity(Round(similarity, 4));
      rel.set_external_1(v1->attributes.external_id.value_or(""));
      rel.set_external_2(v2->attributes.external_id.value_or(""));
      edges.push_back(MakeEdge(model::EntityKind::kVendor, v1->id, model::EntityKind::kVendor, v2->id, model::relation::kSequentialId,
                               similarity, rel));

      if (similarity < kSequentialAlertMin) {
        continue;
      }

      alerts::AlertRequest request;
      request.alert_type  = "vendor_cluster_sequential";
      request.severity    = model::Severity::kLow;
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = v1->id;
      request.title       = "Sequential vendor IDs with similar names";
      request.description = "Vendors '" + v1->display_name + "' (" + rel.external_1() + ") and '" + v2->display_name + "' (" +
                            rel.external_2() + ") have sequential IDs and " + Percent(similarity) +
                            " name similarity. May indicate related entities registered together.";

      auto* ev = request.evidence.mutable_similar_vendor();
      *ev->mutable_vendor_1() = MakeRef(*v1);
      *ev->mutable_vendor_2() = MakeRef(*v2);
      ev->set_similarity(Round(similarity, 4));
      ev->set_method(std::string(model::relation::kSequentialId));
      requests.push_back(std::move(request));
    }

    context.relationships.UpsertAll(edges);
    FRAUDIT_LOG_DEBUG("sequential vendor numbers checked", {IntField("numbered", static_cast<std::int64_t>(numbered.size())),
                                                            IntField("edges", static_cast<std::int64_t>(edges.size()))});
  }
};

} // namespace

std::unique_ptr<DetectionRule> MakeVendorClusteringRule() {
  return std::make_unique<VendorClusteringRule>();
}

} // namespace fraudit::detection
