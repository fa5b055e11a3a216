#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

#include "config/config.pb.h"

namespace fraudit::config {

/*
  Read-only view over detection.thresholds.

  Missing keys resolve to the caller's default; unknown keys are ignored.
*/
class Thresholds {
 public:
  Thresholds() = default;
  explicit Thresholds(const DetectionConfig& detection);
  explicit Thresholds(std::unordered_map<std::string, double> values);

  double Get(const std::string& key, double fallback) const;
  // Whole-number view of Get(): negatives read as 0, fractions are floored
  // and anything above max is clamped to max.
  std::size_t GetCount(const std::string& key, std::size_t fallback, std::size_t max = kMaxCount) const;
  bool Has(const std::string& key) const {
    return values_.contains(key);
  }

 static constexpr std::size_t kMaxCount = 1'000'000;

 private:
  std::unordered_map<std::string, double> values_;
};

} // namespace fraudit::config
