#include "similarity.hpp"

#include <algorithm>
#include <vector>

namespace fraudit::match {

std::size_t LevenshteinDistance(std::string_view a, std::string_view b) {
  if (a.size() < b.size()) {
    std::swap(a, b);
  }
  if (b.empty()) {
    return a.size();
  }

  // two-row dynamic programme over the shorter string
  std::vector<std::size_t> previous(b.size() + 1);
  std::vector<std::size_t> current(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) {
    previous[j] = j;
  }

  for (std::size_t i = 1; i <= a.size(); ++i) {
    current[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t substitution = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      current[j]                     = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
    }
    std::swap(previous, current);
  }
  return previous[b.size()];
}

double Similarity(std::string_view a, std::string_view b) {
  if (a == b) {
    return 1.0;
  }
  const auto longest = std::max(a.size(), b.size());
  return 1.0 - static_cast<double>(LevenshteinDistance(a, b)) / static_cast<double>(longest);
}

std::optional<double> SimilarityAtLeast(std::string_view a, std::string_view b, double threshold) {
  if (a == b) {
    return 1.0;
  }

  const auto longest = std::max(a.size(), b.size());
  const auto gap     = longest - std::min(a.size(), b.size());
  const double best  = 1.0 - static_cast<double>(gap) / static_cast<double>(longest);
  if (best < threshold) {
    return std::nullopt;
  }

  const double score = Similarity(a, b);
  if (score < threshold) {
    return std::nullopt;
  }
  return score;
}

} // namespace fraudit::match
