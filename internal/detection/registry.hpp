#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/detection/rule.hpp"

namespace fraudit::detection {

/*
  Ordered set of detection rules. Registration order is the order of the
  run summary. Rules are shared immutably, so a registry can be copied and
  subset freely.
*/
class RuleRegistry {
 public:
  // Throws util::AlreadyExists when a rule with the same name is registered.
  void Add(std::shared_ptr<const DetectionRule> rule);

  // Canonical name or CLI alias; nullptr when unknown.
  std::shared_ptr<const DetectionRule> Find(std::string_view name) const;

  // Registry restricted to the named rules, in registration order.
  // Throws util::NotFound for unknown names.
  RuleRegistry Subset(const std::vector<std::string>& names) const;

  const std::vector<std::shared_ptr<const DetectionRule>>& Rules() const {
    return rules_;
  }

  std::size_t Size() const {
    return rules_.size();
  }

  // Every built-in rule, in run order.
  static RuleRegistry Default();

 private:
  std::vector<std::shared_ptr<const DetectionRule>> rules_;
};

// Canonical rule name for a CLI alias ("network-analysis" -> "network");
// names that are not aliases are returned unchanged.
std::string CanonicalRuleName(std::string_view name);

} // namespace fraudit::detection
