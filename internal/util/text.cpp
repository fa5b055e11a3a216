#include "text.hpp"

#include <cctype>
#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace fraudit::util {

std::string ToUpper(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string ToLower(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string CollapseWhitespace(std::string_view text) {
  return JoinWords(SplitWords(text));
}

std::vector<std::string> SplitWords(std::string_view text) {
  std::vector<std::string> words;
  std::string              current;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(c);
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

std::string JoinWords(const std::vector<std::string>& words) {
  std::string out;
  for (const auto& word : words) {
    if (word.empty()) {
      continue;
    }
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += word;
  }
  return out;
}

bool Contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

std::string Truncate(std::string_view text, std::size_t max_length) {
  if (text.size() <= max_length) {
    return std::string(text);
  }
  if (max_length <= 3) {
    return std::string(text.substr(0, max_length));
  }
  return std::string(text.substr(0, max_length - 3)) + "...";
}

// "$1,234,567.89"
std::string FormatMoney(double amount) {
  const std::string digits = fmt::format("{:.2f}", std::fabs(amount));

  const auto dot   = digits.find('.');
  std::string whole = digits.substr(0, dot);
  std::string grouped;
  for (std::size_t i = 0; i < whole.size(); ++i) {
    if (i > 0 && (whole.size() - i) % 3 == 0) {
      grouped.push_back(',');
    }
    grouped.push_back(whole[i]);
  }

  return std::string(amount < 0 ? "-$" : "$") + grouped + digits.substr(dot);
}

} // namespace fraudit::util
