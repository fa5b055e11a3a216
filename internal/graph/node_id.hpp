#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "internal/model/entity.hpp"

namespace fraudit::graph {

enum class NodeKind : std::uint8_t {
  kVendor = 1,
  kAgency = 2,
};

// Tagged node identifier; vendor 7 and agency 7 are distinct nodes.
struct NodeId {
  NodeKind        kind = NodeKind::kVendor;
  model::EntityId id   = 0;

  static NodeId Vendor(model::EntityId id) {
    return {NodeKind::kVendor, id};
  }
  static NodeId Agency(model::EntityId id) {
    return {NodeKind::kAgency, id};
  }

  bool IsVendor() const {
    return kind == NodeKind::kVendor;
  }

  auto operator<=>(const NodeId&) const = default;
};

inline std::string ToString(const NodeId& node) {
  return std::string(node.IsVendor() ? "vendor:" : "agency:") + std::to_string(node.id);
}

struct NodeIdHash {
  std::size_t operator()(const NodeId& node) const noexcept {
    return std::hash<std::uint64_t>{}(node.id) * 31 + static_cast<std::size_t>(node.kind);
  }
};

} // namespace fraudit::graph
