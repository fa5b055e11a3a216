#include "rules.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "internal/detection/rule_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace fraudit::detection {

using fraudit::observability::IntField;

namespace {

constexpr std::size_t kContributorsPerVendor = 5;
constexpr std::size_t kListedRecipients      = 10;

class RelatedPartyRule final : public DetectionRule {
 public:
  std::string_view Name() const override {
    return "related_party";
  }
  std::string_view DisplayName() const override {
    return "Related party networks";
  }

  std::vector<alerts::AlertRequest> Run(const RuleContext& context) const override {
    const auto vendors  = IndexById(context.dataset.ListEntities(model::EntityKind::kVendor));
    const auto payments = SummarizeVendorPayments(context.dataset.ListPayments());

    std::vector<alerts::AlertRequest> requests;
    VendorNetworks(context, vendors, requests);
    Triangles(context, vendors, payments, requests);
    CircularPatterns(context, vendors, requests);
    return requests;
  }

 private:
  static evidence::EntityRef Ref(const EntityIndex& index, model::EntityId id) {
    const auto* entity = Lookup(index, id);
    return entity ? MakeRef(*entity) : MakeRef(id);
  }

  static void VendorNetworks(const RuleContext& context, const EntityIndex& vendors, std::vector<alerts::AlertRequest>& requests) {
    const auto   min_size  = context.thresholds.GetCount("related_party_min_network_size", 3);
    const double min_value = context.thresholds.Get("related_party_min_value", 500000);

    for (const auto& component : context.graph.ConnectedComponents(graph::VendorLinksOnly(), min_size)) {
      double total = 0.0;
      for (const auto& member : component.members) {
        total += context.graph.PaymentTotal(member);
      }
      if (total < min_value) {
        continue;
      }

      const std::set<graph::NodeId> members(component.members.begin(), component.members.end());
      std::map<std::string, std::uint32_t> relation_types;
      std::uint64_t                        relationship_count = 0;
      for (const auto& member : component.members) {
        for (const auto& [neighbor, edge] : context.graph.Neighbors(member)) {
          if (!edge.link || !(member < neighbor) || !members.contains(neighbor)) {
            continue;
          }
          for (const auto& type : edge.link->relation_types) {
            ++relation_types[type];
            ++relationship_count;
          }
        }
      }

      alerts::AlertRequest request;
      request.alert_type = "related_party_network";
      request.severity   = model::Severity::kMedium;
      if (component.size >= 5 || total >= 2000000 || relation_types.size() >= 3) {
        request.severity = model::Severity::kHigh;
      }
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = component.members.front().id;

      std::vector<std::string> type_parts;
      for (const auto& [type, count] : relation_types) {
        type_parts.push_back(type + "(" + std::to_string(count) + ")");
      }
      request.title = "Related party network (" + std::to_string(component.size) + " vendors, " + util::FormatMoney(total) + ")";
      request.description = "Found network of " + std::to_string(component.size) + " related vendors with combined payments of " +
                            util::FormatMoney(total) + ". Relationships: " + JoinStrings(type_parts, ", ") +
                            ". This network may indicate coordinated activity, shell companies, or bid rigging.";

      auto* ev = request.evidence.mutable_related_party_network();
      for (const auto& member : component.members) {
        *ev->add_vendors() = Ref(vendors, member.id);
      }
      ev->set_total_value(total);
      for (const auto& [type, count] : relation_types) {
        (*ev->mutable_relation_types())[type] = count;
      }
      ev->set_relationship_count(relationship_count);
      requests.push_back(std::move(request));
    }
  }

  static void Triangles(const RuleContext& context, const EntityIndex& vendors,
                        const std::unordered_map<model::EntityId, PaymentSummary>& payments,
                        std::vector<alerts::AlertRequest>& requests) {
    std::vector<model::RelationshipEdge> links;
    for (auto& edge : context.relationships.QueryAll()) {
      // canonical order puts the vendor first
      if (edge.kind_1 == model::EntityKind::kVendor && edge.kind_2 == model::EntityKind::kEmployee) {
        links.push_back(std::move(edge));
      }
    }
    if (links.empty()) {
      return;
    }

    const auto contributors = context.dataset.ListEntities(model::EntityKind::kContributor);
    if (contributors.empty()) {
      return;
    }
    const auto contributor_index = IndexById(contributors);
    const auto employees         = IndexById(context.dataset.ListEntities(model::EntityKind::kEmployee));

    std::set<model::EntityId>           linked_ids;
    std::vector<model::CanonicalEntity> linked_vendors;
    for (const auto& link : links) {
      if (!linked_ids.insert(link.id_1).second) {
        continue;
      }
      if (const auto* vendor = Lookup(vendors, link.id_1)) {
        linked_vendors.push_back(*vendor);
      }
    }

    const double threshold = context.thresholds.Get("contributor_name_similarity", 0.80);
    const auto   report    = context.matcher.Match(linked_vendors, &contributors, threshold, kContributorsPerVendor);

    std::map<model::EntityId, std::vector<const model::CanonicalEntity*>> contributions_by_vendor;
    for (const auto& pair : report.pairs) {
      if (const auto* contributor = Lookup(contributor_index, pair.id_2)) {
        contributions_by_vendor[pair.id_1].push_back(contributor);
      }
    }

    for (const auto& link : links) {
      const auto* vendor   = Lookup(vendors, link.id_1);
      const auto* employee = Lookup(employees, link.id_2);
      if (!vendor || !employee) {
        continue;
      }
      auto matched = contributions_by_vendor.find(vendor->id);
      if (matched == contributions_by_vendor.end()) {
        continue;
      }
      auto paid = payments.find(vendor->id);
      if (paid == payments.end() || paid->second.total <= 0.0) {
        continue;
      }

      double                        total_contributions = 0.0;
      std::map<std::string, double> recipients;
      for (const auto* contributor : matched->second) {
        const double amount = contributor->attributes.contribution_amount.value_or(0.0);
        total_contributions += amount;
        recipients[contributor->attributes.recipient.value_or("Unknown")] += amount;
      }
      std::vector<std::pair<std::string, double>> ranked(recipients.begin(), recipients.end());
      std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) { return a.second > b.second; });

      alerts::AlertRequest request;
      request.alert_type = "employee_vendor_contributor_triangle";
      request.severity   = (total_contributions >= 10000 || paid->second.total >= 500000) ? model::Severity::kHigh : model::Severity::kMedium;
      request.entity_kind = model::EntityKind::kEmployee;
      request.entity_id   = employee->id;
      request.title       = "Employee-vendor-contributor link: " + employee->display_name;
      request.description = "Employee '" + employee->display_name + "' is linked to vendor '" + vendor->display_name +
                            "' (match type: " + link.relation_type + ", confidence: " + Percent(link.confidence) +
                            "). The vendor has received " + util::FormatMoney(paid->second.total) + " in payments and appears to have made " +
                            util::FormatMoney(total_contributions) + " in campaign contributions.";

      auto* ev = request.evidence.mutable_triangle();
      *ev->mutable_employee() = MakeRef(*employee);
      *ev->mutable_vendor()   = MakeRef(*vendor);
      ev->set_match_type(link.relation_type);
      ev->set_match_confidence(link.confidence);
      ev->set_vendor_payments(paid->second.total);
      ev->set_payment_count(paid->second.count);
      ev->set_contribution_count(matched->second.size());
      ev->set_total_contributions(total_contributions);
      for (std::size_t i = 0; i < ranked.size() && i < kListedRecipients; ++i) {
        auto* recipient = ev->add_recipients();
        recipient->set_name(ranked[i].first);
        recipient->set_amount(ranked[i].second);
      }
      requests.push_back(std::move(request));
    }
  }

  static void CircularPatterns(const RuleContext& context, const EntityIndex& vendors, std::vector<alerts::AlertRequest>& requests) {
    const double min_confidence = context.thresholds.Get("circular_min_confidence", 0.7);
    const double min_amount     = context.thresholds.Get("circular_min_amount", 50000);
    const auto   agencies       = IndexById(context.dataset.ListEntities(model::EntityKind::kAgency));

    std::size_t patterns = 0;

    for (const auto& node : context.graph.Nodes(graph::NodeKind::kVendor)) {
      for (const auto& [neighbor, edge] : context.graph.Neighbors(node)) {
        if (!edge.link || !neighbor.IsVendor() || !(node < neighbor) || edge.link->confidence < min_confidence) {
          continue;
        }

        const auto shared = context.graph.SharedCounterparties(node, neighbor);
        if (shared.empty()) {
          continue;
        }
        double total_1 = 0.0;
        double total_2 = 0.0;
        for (const auto& counterparty : shared) {
          total_1 += counterparty.weight_a;
          total_2 += counterparty.weight_b;
        }
        if (total_1 < min_amount || total_2 < min_amount) {
          continue;
        }

        const auto* v1 = Lookup(vendors, node.id);
        const auto* v2 = Lookup(vendors, neighbor.id);
        if (!v1 || !v2) {
          continue;
        }
        const std::string relation =
            edge.link->relation_types.empty() ? std::string("related") : JoinStrings(edge.link->relation_types, ",");

        alerts::AlertRequest request;
        request.alert_type = "circular_payment_pattern";
        request.severity   = (shared.size() >= 3 || total_1 + total_2 >= 1000000) ? model::Severity::kHigh : model::Severity::kMedium;
        request.entity_kind = model::EntityKind::kVendor;
        request.entity_id   = v1->id;
        request.title       = "Circular payment pattern: " + v1->display_name + " & " + v2->display_name;
        request.description = "Related vendors '" + v1->display_name + "' and '" + v2->display_name + "' (" + relation +
                              ") both receive payments from " + std::to_string(shared.size()) +
                              " common agencies. Vendor 1: " + util::FormatMoney(total_1) + ", Vendor 2: " + util::FormatMoney(total_2) +
                              ". This pattern may indicate bid rotation, market allocation, or coordinated fraud.";

        auto* ev = request.evidence.mutable_circular_payment();
        *ev->mutable_vendor_1() = MakeRef(*v1);
        *ev->mutable_vendor_2() = MakeRef(*v2);
        ev->set_relation_type(relation);
        ev->set_relationship_confidence(edge.link->confidence);
        ev->set_vendor_1_total(total_1);
        ev->set_vendor_2_total(total_2);
        for (const auto& counterparty : shared) {
          auto* agency = ev->add_agencies();
          *agency->mutable_agency() = Ref(agencies, counterparty.counterparty.id);
          agency->set_vendor_1_payments(counterparty.weight_a);
          agency->set_vendor_2_payments(counterparty.weight_b);
        }
        requests.push_back(std::move(request));
        ++patterns;
      }
    }

    FRAUDIT_LOG_DEBUG("circular patterns checked", {IntField("patterns", static_cast<std::int64_t>(patterns))});
  }
};

} // namespace

std::unique_ptr<DetectionRule> MakeRelatedPartyRule() {
  return std::make_unique<RelatedPartyRule>();
}

} // namespace fraudit::detection
