#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace fraudit::match {

// Edit distance over bytes (insert, delete, substitute, each cost 1).
std::size_t LevenshteinDistance(std::string_view a, std::string_view b);

// 1 - distance / max(|a|, |b|). Identical strings, including two empty
// ones, score exactly 1.0.
double Similarity(std::string_view a, std::string_view b);

// Similarity when it can reach threshold, nullopt when the length gap alone
// already rules the pair out.
std::optional<double> SimilarityAtLeast(std::string_view a, std::string_view b, double threshold);

} // namespace fraudit::match
