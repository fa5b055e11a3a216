#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fraudit::util {

std::string ToUpper(std::string_view text);
std::string ToLower(std::string_view text);

// Trims and collapses every whitespace run to a single space.
std::string CollapseWhitespace(std::string_view text);

std::vector<std::string> SplitWords(std::string_view text);
std::string JoinWords(const std::vector<std::string>& words);

bool Contains(std::string_view haystack, std::string_view needle);

// Shortens to max_length bytes, marking the cut with "...".
std::string Truncate(std::string_view text, std::size_t max_length);

std::string FormatMoney(double amount);

} // namespace fraudit::util
