#include "thresholds.hpp"

#include <cmath>

namespace fraudit::config {

Thresholds::Thresholds(const DetectionConfig& detection) {
  for (const auto& [key, value] : detection.thresholds()) {
    values_[key] = value;
  }
}

Thresholds::Thresholds(std::unordered_map<std::string, double> values) : values_(std::move(values)) {
}

double Thresholds::Get(const std::string& key, double fallback) const {
  auto it = values_.find(key);
  if (it == values_.end() || !std::isfinite(it->second)) {
    return fallback;
  }
  return it->second;
}

std::size_t Thresholds::GetCount(const std::string& key, std::size_t fallback, std::size_t max) const {
  if (fallback > max) fallback = max;
  const double value = std::floor(Get(key, static_cast<double>(fallback)));
  if (value <= 0) return 0;
  if (value >= static_cast<double>(max)) return max;
  return static_cast<std::size_t>(value);
}

} // namespace fraudit::config
