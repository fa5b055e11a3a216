#include "name_normalizer.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "internal/util/text.hpp"

namespace fraudit::normalize {

namespace {

// Keys are tokens with their periods removed.
const std::unordered_map<std::string, std::string>& BusinessSuffixes() {
  static const std::unordered_map<std::string, std::string> kSuffixes = {
      {"LLC", "LLC"},  {"INC", "INC"},   {"INCORPORATED", "INC"}, {"CORP", "CORP"}, {"CORPORATION", "CORP"},
      {"CO", "CO"},    {"COMPANY", "CO"}, {"LTD", "LTD"},          {"LIMITED", "LTD"}, {"LP", "LP"},
      {"LLP", "LLP"},  {"PLLC", "PLLC"}, {"PC", "PC"},             {"DBA", "DBA"},    {"D/B/A", "DBA"},
  };
  return kSuffixes;
}

const std::unordered_map<std::string, std::string>& Abbreviations() {
  static const std::unordered_map<std::string, std::string> kAbbreviations = {
      {"INTL", "INTERNATIONAL"}, {"INT'L", "INTERNATIONAL"}, {"NATL", "NATIONAL"},   {"NAT'L", "NATIONAL"},
      {"SVCS", "SERVICES"},      {"SVC", "SERVICE"},         {"MGMT", "MANAGEMENT"}, {"MGT", "MANAGEMENT"},
      {"ASSOC", "ASSOCIATES"},   {"ASSN", "ASSOCIATION"},    {"GRP", "GROUP"},       {"SYS", "SYSTEMS"},
      {"TECH", "TECHNOLOGY"},    {"TECHS", "TECHNOLOGIES"},  {"GOVT", "GOVERNMENT"}, {"GOV", "GOVERNMENT"},
      {"UNIV", "UNIVERSITY"},    {"HOSP", "HOSPITAL"},       {"MED", "MEDICAL"},     {"CTR", "CENTER"},
      {"CNTR", "CENTER"},
  };
  return kAbbreviations;
}

const std::unordered_set<std::string>& FillerWords() {
  static const std::unordered_set<std::string> kFiller = {"THE", "OF", "AND", "&", "FOR", "A", "AN"};
  return kFiller;
}

bool IsDroppedPunctuation(char c) {
  switch (c) {
    case '.':
    case ',':
    case ';':
    case ':':
    case '!':
    case '?':
    case '"':
    case '(':
    case ')':
    case '[':
    case ']':
    case '{':
    case '}':
      return true;
    default:
      return false;
  }
}

std::string WithoutPeriods(std::string_view token) {
  std::string out;
  out.reserve(token.size());
  for (char c : token) {
    if (c != '.') {
      out.push_back(c);
    }
  }
  return out;
}

// Splits "INC.," into the core "INC." and the trailing separators ",".
std::pair<std::string, std::string> SplitTrailingSeparators(const std::string& token) {
  auto end = token.size();
  while (end > 0 && (token[end - 1] == ',' || token[end - 1] == ';' || token[end - 1] == ':')) {
    --end;
  }
  return {token.substr(0, end), token.substr(end)};
}

std::string StandardizeToken(const std::string& token) {
  auto [core, trailing] = SplitTrailingSeparators(token);

  const auto key = WithoutPeriods(core);
  if (auto it = BusinessSuffixes().find(key); it != BusinessSuffixes().end()) {
    return it->second + trailing;
  }
  if (auto it = Abbreviations().find(core); it != Abbreviations().end()) {
    return it->second + trailing;
  }
  return token;
}

} // namespace

std::optional<std::string> CanonicalizeName(std::optional<std::string_view> raw) {
  if (!raw || raw->empty()) {
    return std::nullopt;
  }

  auto words = util::SplitWords(util::ToUpper(*raw));
  for (auto& word : words) {
    word = StandardizeToken(word);
  }

  std::string joined = util::JoinWords(words);
  std::string cleaned;
  cleaned.reserve(joined.size() + 8);
  for (char c : joined) {
    if (IsDroppedPunctuation(c)) {
      continue;
    }
    if (c == '&') {
      cleaned += " AND ";
      continue;
    }
    cleaned.push_back(c);
  }

  words = util::SplitWords(cleaned);
  if (words.size() > 1) {
    std::vector<std::string> kept;
    kept.reserve(words.size());
    for (auto& word : words) {
      if (!FillerWords().contains(word)) {
        kept.push_back(std::move(word));
      }
    }
    words = std::move(kept);
  }

  auto normalized = util::JoinWords(words);
  if (normalized.empty()) {
    return std::nullopt;
  }
  return normalized;
}

std::vector<std::string> BlockingKeys(std::string_view normalized_name, std::size_t n) {
  if (normalized_name.empty() || n == 0) {
    return {};
  }

  const auto take = std::min(n, normalized_name.size());
  return {
      "P:" + std::string(normalized_name.substr(0, take)),
      "S:" + std::string(normalized_name.substr(normalized_name.size() - take)),
  };
}

} // namespace fraudit::normalize
