#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/graph/node_id.hpp"
#include "internal/model/relationship.hpp"
#include "internal/model/transaction.hpp"

namespace fraudit::graph {

// vendor-agency aggregate
struct PaymentWeight {
  double        payment_total  = 0.0;
  std::uint64_t payment_count  = 0;
  double        contract_total = 0.0;
  std::uint64_t contract_count = 0;
};

// vendor-vendor edge merged from relationship rows
struct VendorLink {
  double                   confidence = 0.0;
  std::vector<std::string> relation_types;
};

struct GraphEdge {
  std::optional<PaymentWeight> payment;
  std::optional<VendorLink>    link;
};

using EdgeFilter = std::function<bool(const NodeId& a, const NodeId& b, const GraphEdge& edge)>;

struct Component {
  std::vector<NodeId> members;
  std::size_t         size = 0;
};

struct DegreeOutlier {
  NodeId      node;
  std::size_t degree = 0;
  double      mean   = 0.0;
  double      stddev = 0.0;
};

struct DominantShare {
  NodeId top_neighbor;
  double top_weight   = 0.0;
  double total_weight = 0.0;
  double share        = 0.0;
};

struct SharedCounterparty {
  NodeId counterparty;
  double weight_a = 0.0;
  double weight_b = 0.0;
};

/*
  Bipartite vendor-agency payment graph plus vendor-vendor relationship
  edges. Built once per detection run and immutable afterwards, so every
  query is safe to call concurrently.

  Edge weights are payment totals. Results are ordered by NodeId.
*/
class PaymentGraph {
 public:
  static PaymentGraph Build(const std::vector<model::VendorAgencyAggregate>& aggregates,
                            const std::vector<model::RelationshipEdge>&      relationships);

  std::size_t NodeCount() const {
    return adjacency_.size();
  }
  std::size_t EdgeCount() const;

  bool HasNode(const NodeId& node) const {
    return adjacency_.contains(node);
  }

  std::vector<NodeId> Nodes(NodeKind kind) const;

  // Empty for unknown nodes.
  const std::map<NodeId, GraphEdge>& Neighbors(const NodeId& node) const;

  std::optional<PaymentWeight> Payment(const NodeId& vendor, const NodeId& agency) const;

  // Sum of payment totals over the node's vendor-agency edges.
  double PaymentTotal(const NodeId& node) const;

  // Number of neighbors of the opposite kind.
  std::size_t CounterpartyDegree(const NodeId& node) const;

  // Components of the subgraph formed by edges passing the filter. Only
  // nodes incident to such an edge take part.
  std::vector<Component> ConnectedComponents(const EdgeFilter& filter, std::size_t min_size) const;

  // Nodes whose counterparty degree is >= mean + z * stddev and >= min_degree,
  // with mean and population stddev over every node of that kind.
  // Nobody is flagged when stddev is zero.
  std::vector<DegreeOutlier> DegreeOutliers(NodeKind kind, std::size_t min_degree, double z_threshold) const;

  // Share of the node's payment total going to its largest counterparty;
  // nullopt when the node has no positive payment total.
  std::optional<DominantShare> DominantEdgeShare(const NodeId& node) const;

  // Counterparties paid by (or paying) both nodes with non-zero weight on each side.
  std::vector<SharedCounterparty> SharedCounterparties(const NodeId& a, const NodeId& b) const;

 private:
  std::map<NodeId, std::map<NodeId, GraphEdge>> adjacency_;
};

// Filters for ConnectedComponents.
EdgeFilter VendorLinksOnly(double min_confidence = 0.0);
EdgeFilter PaymentEdgesOnly();

} // namespace fraudit::graph
