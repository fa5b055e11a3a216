#include "payment_graph.hpp"

#include <algorithm>
#include <cmath>
#include <queue>
#include <set>

namespace fraudit::graph {

namespace {

// Absorbs rounding in mean + z * stddev so exact ties are flagged.
constexpr double kTieEpsilon = 1e-9;

void MergeLink(GraphEdge& edge, double confidence, const std::string& relation_type) {
  if (!edge.link) {
    edge.link.emplace();
  }
  edge.link->confidence = std::max(edge.link->confidence, confidence);
  auto& types           = edge.link->relation_types;
  if (std::find(types.begin(), types.end(), relation_type) == types.end()) {
    types.push_back(relation_type);
    std::sort(types.begin(), types.end());
  }
}

} // namespace

PaymentGraph PaymentGraph::Build(const std::vector<model::VendorAgencyAggregate>& aggregates,
                                 const std::vector<model::RelationshipEdge>&      relationships) {
  PaymentGraph graph;

  for (const auto& aggregate : aggregates) {
    const auto vendor = NodeId::Vendor(aggregate.vendor_id);
    const auto agency = NodeId::Agency(aggregate.agency_id);

    PaymentWeight weight{aggregate.payment_total, aggregate.payment_count, aggregate.contract_total, aggregate.contract_count};
    graph.adjacency_[vendor][agency].payment = weight;
    graph.adjacency_[agency][vendor].payment = weight;
  }

  for (const auto& relationship : relationships) {
    if (relationship.kind_1 != model::EntityKind::kVendor || relationship.kind_2 != model::EntityKind::kVendor ||
        relationship.id_1 == relationship.id_2) {
      continue;
    }
    const auto a = NodeId::Vendor(relationship.id_1);
    const auto b = NodeId::Vendor(relationship.id_2);
    MergeLink(graph.adjacency_[a][b], relationship.confidence, relationship.relation_type);
    MergeLink(graph.adjacency_[b][a], relationship.confidence, relationship.relation_type);
  }

  return graph;
}

std::size_t PaymentGraph::EdgeCount() const {
  std::size_t count = 0;
  for (const auto& [node, neighbors] : adjacency_) {
    for (const auto& [neighbor, edge] : neighbors) {
      if (node < neighbor) {
        ++count;
      }
    }
  }
  return count;
}

std::vector<NodeId> PaymentGraph::Nodes(NodeKind kind) const {
  std::vector<NodeId> nodes;
  for (const auto& [node, _] : adjacency_) {
    if (node.kind == kind) nodes.push_back(node);
  }
  return nodes;
}

const std::map<NodeId, GraphEdge>& PaymentGraph::Neighbors(const NodeId& node) const {
  static const std::map<NodeId, GraphEdge> kEmpty;
  auto                                     it = adjacency_.find(node);
  return it == adjacency_.end() ? kEmpty : it->second;
}

std::optional<PaymentWeight> PaymentGraph::Payment(const NodeId& vendor, const NodeId& agency) const {
  const auto& neighbors = Neighbors(vendor);
  auto        it        = neighbors.find(agency);
  if (it == neighbors.end()) return std::nullopt;
  return it->second.payment;
}

double PaymentGraph::PaymentTotal(const NodeId& node) const {
  double total = 0.0;
  for (const auto& [_, edge] : Neighbors(node)) {
    if (edge.payment) total += edge.payment->payment_total;
  }
  return total;
}

std::size_t PaymentGraph::CounterpartyDegree(const NodeId& node) const {
  std::size_t degree = 0;
  for (const auto& [neighbor, edge] : Neighbors(node)) {
    if (neighbor.kind != node.kind && edge.payment) ++degree;
  }
  return degree;
}

std::vector<Component> PaymentGraph::ConnectedComponents(const EdgeFilter& filter, std::size_t min_size) const {
  std::map<NodeId, std::vector<NodeId>> subgraph;
  for (const auto& [node, neighbors] : adjacency_) {
    for (const auto& [neighbor, edge] : neighbors) {
      if (filter(node, neighbor, edge)) {
        subgraph[node].push_back(neighbor);
      }
    }
  }

  std::set<NodeId>       visited;
  std::vector<Component> components;
  for (const auto& [start, _] : subgraph) {
    if (visited.contains(start)) {
      continue;
    }

    Component          component;
    std::queue<NodeId> frontier;
    frontier.push(start);
    visited.insert(start);
    while (!frontier.empty()) {
      auto node = frontier.front();
      frontier.pop();
      component.members.push_back(node);

      auto it = subgraph.find(node);
      if (it == subgraph.end()) continue;
      for (const auto& next : it->second) {
        if (visited.insert(next).second) {
          frontier.push(next);
        }
      }
    }

    std::sort(component.members.begin(), component.members.end());
    component.size = component.members.size();
    if (component.size >= min_size) {
      components.push_back(std::move(component));
    }
  }

  // BFS starts in NodeId order, so components are already ordered by
  // their smallest member.
  return components;
}

std::vector<DegreeOutlier> PaymentGraph::DegreeOutliers(NodeKind kind, std::size_t min_degree, double z_threshold) const {
  std::vector<std::pair<NodeId, std::size_t>> degrees;
  for (const auto& node : Nodes(kind)) {
    degrees.emplace_back(node, CounterpartyDegree(node));
  }
  if (degrees.empty()) {
    return {};
  }

  double sum = 0.0;
  for (const auto& [_, degree] : degrees) sum += static_cast<double>(degree);
  const double mean = sum / static_cast<double>(degrees.size());

  double squares = 0.0;
  for (const auto& [_, degree] : degrees) {
    const double delta = static_cast<double>(degree) - mean;
    squares += delta * delta;
  }
  const double stddev = std::sqrt(squares / static_cast<double>(degrees.size()));
  if (stddev == 0.0) {
    return {};
  }

  const double               threshold = mean + z_threshold * stddev;
  std::vector<DegreeOutlier> outliers;
  for (const auto& [node, degree] : degrees) {
    if (static_cast<double>(degree) + kTieEpsilon >= threshold && degree >= min_degree) {
      outliers.push_back({node, degree, mean, stddev});
    }
  }
  return outliers;
}

std::optional<DominantShare> PaymentGraph::DominantEdgeShare(const NodeId& node) const {
  DominantShare result;
  bool          found = false;
  for (const auto& [neighbor, edge] : Neighbors(node)) {
    if (!edge.payment) continue;
    const double weight = edge.payment->payment_total;
    result.total_weight += weight;
    if (!found || weight > result.top_weight) {
      result.top_neighbor = neighbor;
      result.top_weight   = weight;
      found               = true;
    }
  }

  if (!found || result.total_weight <= 0.0) {
    return std::nullopt;
  }
  result.share = result.top_weight / result.total_weight;
  return result;
}

std::vector<SharedCounterparty> PaymentGraph::SharedCounterparties(const NodeId& a, const NodeId& b) const {
  std::vector<SharedCounterparty> shared;
  const auto&                     neighbors_b = Neighbors(b);
  for (const auto& [neighbor, edge_a] : Neighbors(a)) {
    if (neighbor == a || neighbor == b || !edge_a.payment || edge_a.payment->payment_total == 0.0) continue;

    auto it = neighbors_b.find(neighbor);
    if (it == neighbors_b.end() || !it->second.payment || it->second.payment->payment_total == 0.0) continue;

    shared.push_back({neighbor, edge_a.payment->payment_total, it->second.payment->payment_total});
  }
  return shared;
}

EdgeFilter VendorLinksOnly(double min_confidence) {
  return [min_confidence](const NodeId&, const NodeId&, const GraphEdge& edge) {
    return edge.link.has_value() && edge.link->confidence >= min_confidence;
  };
}

EdgeFilter PaymentEdgesOnly() {
  return [](const NodeId&, const NodeId&, const GraphEdge& edge) { return edge.payment.has_value(); };
}

} // namespace fraudit::graph
