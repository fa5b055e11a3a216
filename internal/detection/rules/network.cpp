#include "rules.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "internal/detection/rule_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace fraudit::detection {

using fraudit::observability::IntField;

namespace {

constexpr std::size_t kMinGraphNodes     = 10;
constexpr std::size_t kMaxClusterSize    = 20;
constexpr std::size_t kMaxListedAgencies = 20;

class NetworkRule final : public DetectionRule {
 public:
  std::string_view Name() const override {
    return "network";
  }
  std::string_view DisplayName() const override {
    return "Network analysis";
  }

  std::vector<alerts::AlertRequest> Run(const RuleContext& context) const override {
    std::vector<alerts::AlertRequest> requests;
    if (context.graph.NodeCount() < kMinGraphNodes) {
      FRAUDIT_LOG_INFO("insufficient data for network analysis", {IntField("nodes", static_cast<std::int64_t>(context.graph.NodeCount()))});
      return requests;
    }

    const auto vendors  = IndexById(context.dataset.ListEntities(model::EntityKind::kVendor));
    const auto agencies = IndexById(context.dataset.ListEntities(model::EntityKind::kAgency));

    HubVendors(context, vendors, agencies, requests);
    IsolatedClusters(context, vendors, agencies, requests);
    ExclusiveRelationships(context, vendors, agencies, requests);
    return requests;
  }

 private:
  static evidence::EntityRef Ref(const EntityIndex& index, model::EntityId id) {
    const auto* entity = Lookup(index, id);
    return entity ? MakeRef(*entity) : MakeRef(id);
  }

  static void HubVendors(const RuleContext& context, const EntityIndex& vendors, const EntityIndex& agencies,
                         std::vector<alerts::AlertRequest>& requests) {
    const double z          = context.thresholds.Get("network_hub_z", 2.0);
    const auto   min_degree = context.thresholds.GetCount("network_hub_min_degree", 10);

    for (const auto& outlier : context.graph.DegreeOutliers(graph::NodeKind::kVendor, min_degree, z)) {
      const auto* vendor = Lookup(vendors, outlier.node.id);
      if (!vendor) {
        continue;
      }

      std::vector<evidence::AgencyShare> shares;
      double                             total = 0.0;
      for (const auto& [neighbor, edge] : context.graph.Neighbors(outlier.node)) {
        if (neighbor.IsVendor() || !edge.payment) {
          continue;
        }
        evidence::AgencyShare share;
        *share.mutable_agency() = Ref(agencies, neighbor.id);
        share.set_payment_total(edge.payment->payment_total);
        share.set_payment_count(edge.payment->payment_count);
        shares.push_back(std::move(share));
        total += edge.payment->payment_total;
      }
      std::stable_sort(shares.begin(), shares.end(),
                       [](const auto& a, const auto& b) { return a.payment_total() > b.payment_total(); });

      alerts::AlertRequest request;
      request.alert_type = "hub_vendor";
      request.severity   = static_cast<double>(outlier.degree) >= outlier.mean + 3.0 * outlier.stddev ? model::Severity::kMedium
                                                                                                       : model::Severity::kLow;
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = vendor->id;
      request.title       = "Hub vendor: " + vendor->display_name;
      request.description = fmt::format(
          "Vendor '{}' has relationships with {} agencies (average vendor: {:.1f} agencies). Total value: {}. "
          "This high connectivity may warrant review.",
          vendor->display_name, outlier.degree, outlier.mean, util::FormatMoney(total));

      auto* ev = request.evidence.mutable_hub_vendor();
      *ev->mutable_vendor() = MakeRef(*vendor);
      ev->set_degree(outlier.degree);
      ev->set_mean_degree(Round(outlier.mean, 1));
      ev->set_stddev(Round(outlier.stddev, 2));
      ev->set_total_value(total);
      for (std::size_t i = 0; i < shares.size() && i < kMaxListedAgencies; ++i) {
        *ev->add_agencies() = shares[i];
      }
      requests.push_back(std::move(request));
    }
  }

  static void IsolatedClusters(const RuleContext& context, const EntityIndex& vendors, const EntityIndex& agencies,
                               std::vector<alerts::AlertRequest>& requests) {
    for (const auto& component : context.graph.ConnectedComponents(graph::VendorLinksOnly(), 3)) {
      if (component.size > kMaxClusterSize) {
        continue;
      }

      // agency -> (members it pays, amount)
      std::map<graph::NodeId, std::pair<std::uint64_t, double>> agency_use;
      double                                                    total = 0.0;
      for (const auto& member : component.members) {
        for (const auto& [neighbor, edge] : context.graph.Neighbors(member)) {
          if (neighbor.IsVendor() || !edge.payment) {
            continue;
          }
          auto& use = agency_use[neighbor];
          ++use.first;
          use.second += edge.payment->payment_total;
          total += edge.payment->payment_total;
        }
      }

      alerts::AlertRequest request;
      auto*                ev = request.evidence.mutable_vendor_cluster();
      for (const auto& [agency, use] : agency_use) {
        if (use.first < 2) {
          continue;
        }
        auto* share              = ev->add_common_agencies();
        *share->mutable_agency() = Ref(agencies, agency.id);
        share->set_payment_total(use.second);
        share->set_vendor_count(use.first);
      }
      if (ev->common_agencies_size() == 0) {
        continue;
      }
      for (const auto& member : component.members) {
        *ev->add_vendors() = Ref(vendors, member.id);
      }
      ev->set_total_value(total);

      request.alert_type  = "vendor_cluster";
      request.severity    = (component.size >= 5 && total >= 1000000) ? model::Severity::kHigh : model::Severity::kMedium;
      request.entity_kind = model::EntityKind::kVendor;
      request.entity_id   = component.members.front().id;
      request.title       = "Related vendor cluster (" + std::to_string(component.size) + " vendors)";
      request.description = "Found cluster of " + std::to_string(component.size) + " related vendors sharing " +
                            std::to_string(ev->common_agencies_size()) + " common agencies. Total combined payments: " +
                            util::FormatMoney(total) + ". This pattern may indicate coordinated activity.";
      requests.push_back(std::move(request));
    }
  }

  static void ExclusiveRelationships(const RuleContext& context, const EntityIndex& vendors, const EntityIndex& agencies,
                                     std::vector<alerts::AlertRequest>& requests) {
    const double min_total = context.thresholds.Get("exclusive_min_total", 100000);
    const double min_share = context.thresholds.Get("exclusive_share", 0.80);

    for (const auto& node : context.graph.Nodes(graph::NodeKind::kAgency)) {
      auto dominant = context.graph.DominantEdgeShare(node);
      if (!dominant || dominant->total_weight < min_total || dominant->share < min_share) {
        continue;
      }
      const auto* agency = Lookup(agencies, node.id);
      if (!agency) {
        continue;
      }
      const auto* top = Lookup(vendors, dominant->top_neighbor.id);

      alerts::AlertRequest request;
      request.alert_type = "exclusive_relationship";
      request.severity   = (dominant->share >= 0.95 || dominant->top_weight >= 5000000) ? model::Severity::kHigh : model::Severity::kMedium;
      request.entity_kind = model::EntityKind::kAgency;
      request.entity_id   = agency->id;
      request.title       = "Agency spending concentration: " + agency->display_name;
      request.description = agency->display_name + " directs " + Percent(dominant->share) + " of spending (" +
                            util::FormatMoney(dominant->top_weight) + ") to '" + (top ? top->display_name : "Unknown") +
                            "'. Total spending: " + util::FormatMoney(dominant->total_weight) + " across " +
                            std::to_string(context.graph.CounterpartyDegree(node)) + " vendors.";

      auto* ev = request.evidence.mutable_exclusive_relationship();
      *ev->mutable_agency()     = MakeRef(*agency);
      *ev->mutable_top_vendor() = top ? MakeRef(*top) : MakeRef(dominant->top_neighbor.id);
      ev->set_top_vendor_share(Round(dominant->share * 100.0, 1));
      ev->set_top_vendor_value(dominant->top_weight);
      ev->set_total_value(dominant->total_weight);
      ev->set_vendor_count(context.graph.CounterpartyDegree(node));
      requests.push_back(std::move(request));
    }
  }
};

} // namespace

std::unique_ptr<DetectionRule> MakeNetworkRule() {
  return std::make_unique<NetworkRule>();
}

} // namespace fraudit::detection
