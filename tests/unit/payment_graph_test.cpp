#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "internal/graph/payment_graph.hpp"

namespace {

using fraudit::graph::NodeId;
using fraudit::graph::NodeKind;
using fraudit::graph::PaymentEdgesOnly;
using fraudit::graph::PaymentGraph;
using fraudit::graph::VendorLinksOnly;
using fraudit::model::EntityKind;
using fraudit::model::RelationshipEdge;
using fraudit::model::VendorAgencyAggregate;

VendorAgencyAggregate Paid(std::uint64_t vendor, std::uint64_t agency, double total) {
  VendorAgencyAggregate aggregate;
  aggregate.vendor_id     = vendor;
  aggregate.agency_id     = agency;
  aggregate.payment_total = total;
  aggregate.payment_count = 1;
  return aggregate;
}

RelationshipEdge Link(std::uint64_t a, std::uint64_t b, const char* type, double confidence) {
  RelationshipEdge edge;
  edge.kind_1        = EntityKind::kVendor;
  edge.id_1          = a;
  edge.kind_2        = EntityKind::kVendor;
  edge.id_2          = b;
  edge.relation_type = type;
  edge.confidence    = confidence;
  return edge;
}

// Vendor v pays agencies 1..degrees[v-1].
std::vector<VendorAgencyAggregate> WithDegrees(const std::vector<std::size_t>& degrees) {
  std::vector<VendorAgencyAggregate> aggregates;
  for (std::size_t v = 0; v < degrees.size(); ++v) {
    for (std::size_t a = 1; a <= degrees[v]; ++a) {
      aggregates.push_back(Paid(v + 1, a, 1000.0));
    }
  }
  return aggregates;
}

void TestDegreeOutlierThreshold() {
  auto graph    = PaymentGraph::Build(WithDegrees({2, 2, 3, 3, 4, 4, 20}), {});
  auto outliers = graph.DegreeOutliers(NodeKind::kVendor, 10, 2.0);

  assert(outliers.size() == 1);
  assert(outliers[0].node == NodeId::Vendor(7));
  assert(outliers[0].degree == 20);
  assert(std::fabs(outliers[0].mean - 38.0 / 7.0) < 1e-9);
  // population variance: E[x^2] - mean^2
  const double variance = 458.0 / 7.0 - (38.0 / 7.0) * (38.0 / 7.0);
  assert(std::fabs(outliers[0].stddev - std::sqrt(variance)) < 1e-9);
  assert(20.0 >= outliers[0].mean + 2.0 * outliers[0].stddev);

  // no spread, nobody flagged
  auto flat = PaymentGraph::Build(WithDegrees({5, 5, 5, 5, 5, 5, 5}), {});
  assert(flat.DegreeOutliers(NodeKind::kVendor, 0, 2.0).empty());

  // min_degree still applies to a statistical outlier
  assert(graph.DegreeOutliers(NodeKind::kVendor, 21, 2.0).empty());
}

void TestVendorLinkComponents() {
  std::vector<VendorAgencyAggregate> aggregates = {Paid(1, 100, 10), Paid(2, 100, 10), Paid(3, 101, 10), Paid(9, 101, 10)};
  std::vector<RelationshipEdge>      links      = {
      Link(1, 2, "same_address", 0.8),
      Link(2, 3, "similar_name", 0.9),
      Link(1, 2, "similar_name", 0.95),
      Link(5, 6, "sequential_id", 0.5),
  };
  auto graph = PaymentGraph::Build(aggregates, links);

  auto components = graph.ConnectedComponents(VendorLinksOnly(), 2);
  assert(components.size() == 2);
  assert(components[0].size == 3);
  assert(components[0].members[0] == NodeId::Vendor(1));
  assert(components[0].members[2] == NodeId::Vendor(3));
  assert(components[1].members[0] == NodeId::Vendor(5));

  // weak links drop out above the confidence floor
  auto strong = graph.ConnectedComponents(VendorLinksOnly(0.7), 2);
  assert(strong.size() == 1);

  // repeated links merge: highest confidence, every relation type once
  const auto& edge = graph.Neighbors(NodeId::Vendor(1)).at(NodeId::Vendor(2));
  assert(edge.link->confidence == 0.95);
  assert(edge.link->relation_types.size() == 2);
  assert(!edge.payment.has_value());

  // payment subgraph: {1, 2, agency 100} and {3, 9, agency 101}
  auto paid = graph.ConnectedComponents(PaymentEdgesOnly(), 3);
  assert(paid.size() == 2);
  assert(graph.EdgeCount() == 4 + 3);
}

void TestDominantShareAndSharedCounterparties() {
  std::vector<VendorAgencyAggregate> aggregates = {
      Paid(1, 100, 900000), Paid(2, 100, 100000), Paid(1, 200, 60000), Paid(2, 200, 75000), Paid(2, 300, 5000),
  };
  auto graph = PaymentGraph::Build(aggregates, {Link(1, 2, "same_address", 0.8)});

  auto share = graph.DominantEdgeShare(NodeId::Agency(100));
  assert(share.has_value());
  assert(share->top_neighbor == NodeId::Vendor(1));
  assert(share->total_weight == 1000000);
  assert(std::fabs(share->share - 0.9) < 1e-12);

  assert(!graph.DominantEdgeShare(NodeId::Agency(999)).has_value());

  auto shared = graph.SharedCounterparties(NodeId::Vendor(1), NodeId::Vendor(2));
  assert(shared.size() == 2);
  assert(shared[0].counterparty == NodeId::Agency(100));
  assert(shared[0].weight_a == 900000);
  assert(shared[0].weight_b == 100000);
  assert(shared[1].counterparty == NodeId::Agency(200));

  assert(graph.PaymentTotal(NodeId::Vendor(2)) == 180000);
  assert(graph.CounterpartyDegree(NodeId::Vendor(2)) == 3);
  assert(graph.CounterpartyDegree(NodeId::Vendor(1)) == 2);
  assert(graph.Nodes(NodeKind::kAgency).size() == 3);
}

} // namespace

int main() {
  TestDegreeOutlierThreshold();
  TestVendorLinkComponents();
  TestDominantShareAndSharedCounterparties();

  std::cout << "fraudit_unit_payment_graph: pass\n";
  return 0;
}
