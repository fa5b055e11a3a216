#include "address_normalizer.hpp"

#include <cctype>
#include <unordered_map>
#include <vector>

#include "internal/match/similarity.hpp"
#include "internal/util/text.hpp"

namespace fraudit::normalize {

namespace {

const std::unordered_map<std::string, std::string>& StreetTypes() {
  static const std::unordered_map<std::string, std::string> kTypes = {
      {"AVENUE", "AVE"},     {"AVE", "AVE"},   {"BOULEVARD", "BLVD"}, {"BLVD", "BLVD"},   {"CIRCLE", "CIR"},
      {"CIR", "CIR"},        {"COURT", "CT"},  {"CT", "CT"},          {"DRIVE", "DR"},    {"DR", "DR"},
      {"EXPRESSWAY", "EXPY"}, {"EXPY", "EXPY"}, {"FREEWAY", "FWY"},    {"FWY", "FWY"},     {"HIGHWAY", "HWY"},
      {"HWY", "HWY"},        {"LANE", "LN"},   {"LN", "LN"},          {"PARKWAY", "PKWY"}, {"PKWY", "PKWY"},
      {"PLACE", "PL"},       {"PL", "PL"},     {"ROAD", "RD"},        {"RD", "RD"},       {"STREET", "ST"},
      {"ST", "ST"},          {"TERRACE", "TER"}, {"TER", "TER"},      {"TRAIL", "TRL"},   {"TRL", "TRL"},
      {"WAY", "WAY"},
  };
  return kTypes;
}

const std::unordered_map<std::string, std::string>& Directions() {
  static const std::unordered_map<std::string, std::string> kDirections = {
      {"NORTH", "N"},      {"SOUTH", "S"},      {"EAST", "E"},       {"WEST", "W"},
      {"NORTHEAST", "NE"}, {"NORTHWEST", "NW"}, {"SOUTHEAST", "SE"}, {"SOUTHWEST", "SW"},
  };
  return kDirections;
}

const std::unordered_map<std::string, std::string>& UnitTypes() {
  static const std::unordered_map<std::string, std::string> kUnits = {
      {"APARTMENT", "APT"}, {"APT", "APT"}, {"BUILDING", "BLDG"}, {"BLDG", "BLDG"}, {"FLOOR", "FL"}, {"FL", "FL"},
      {"SUITE", "STE"},     {"STE", "STE"}, {"UNIT", "UNIT"},     {"ROOM", "RM"},    {"RM", "RM"},   {"#", "UNIT"},
  };
  return kUnits;
}

const std::unordered_map<std::string, std::string>& StateNames() {
  static const std::unordered_map<std::string, std::string> kStates = {
      {"TEXAS", "TX"}, {"OKLAHOMA", "OK"}, {"NEW MEXICO", "NM"}, {"ARKANSAS", "AR"}, {"LOUISIANA", "LA"},
  };
  return kStates;
}

std::string Lookup(const std::unordered_map<std::string, std::string>& table, const std::string& word) {
  auto it = table.find(word);
  return it == table.end() ? word : it->second;
}

bool AllDigits(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

bool AllAlpha(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (!std::isalpha(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

// "78701" or "78701-1234" at the end of the line.
std::optional<std::string> TakeTrailingZip(std::vector<std::string>& words) {
  if (words.empty()) {
    return std::nullopt;
  }

  const auto& last = words.back();
  const auto  dash = last.find('-');
  const auto  head = last.substr(0, dash);
  const bool  plus_four_ok = dash == std::string::npos || (last.size() - dash - 1 == 4 && AllDigits(last.substr(dash + 1)));
  if (head.size() != 5 || !AllDigits(head) || !plus_four_ok) {
    return std::nullopt;
  }

  words.pop_back();
  return head;
}

std::string TrimTrailingComma(std::string text) {
  while (!text.empty() && (text.back() == ',' || text.back() == ' ')) {
    text.pop_back();
  }
  return text;
}

std::optional<std::string> NonEmpty(std::optional<std::string> part) {
  if (part && part->empty()) {
    return std::nullopt;
  }
  return part;
}

ParsedAddress Assemble(std::optional<std::string> street, std::optional<std::string> city, std::optional<std::string> state,
                       std::optional<std::string> zip_code) {
  ParsedAddress parsed;
  parsed.street   = NonEmpty(std::move(street));
  parsed.city     = NonEmpty(std::move(city));
  parsed.state    = NonEmpty(std::move(state));
  parsed.zip_code = NonEmpty(std::move(zip_code));

  std::vector<std::string> parts;
  for (const auto& part : {parsed.street, parsed.city, parsed.state, parsed.zip_code}) {
    if (part) {
      parts.push_back(*part);
    }
  }
  parsed.normalized = util::JoinWords(parts);
  return parsed;
}

ParsedAddress ParseFullAddress(std::string_view raw) {
  auto words = util::SplitWords(util::ToUpper(raw));

  std::optional<std::string> zip_code = TakeTrailingZip(words);
  std::optional<std::string> state;

  std::string rest = TrimTrailingComma(util::JoinWords(words));
  // A bare two-letter tail is only a state when it follows a city or a ZIP.
  if (zip_code || rest.find(',') != std::string::npos) {
    for (const auto& [name, code] : StateNames()) {
      if (rest.size() > name.size() && rest.ends_with(name) && (rest[rest.size() - name.size() - 1] == ' ' || rest[rest.size() - name.size() - 1] == ',')) {
        state = code;
        rest  = TrimTrailingComma(rest.substr(0, rest.size() - name.size()));
        break;
      }
    }
    if (!state && rest.size() >= 3) {
      const auto tail = rest.substr(rest.size() - 2);
      const char sep  = rest[rest.size() - 3];
      if (AllAlpha(tail) && (sep == ' ' || sep == ',')) {
        state = tail;
        rest  = TrimTrailingComma(rest.substr(0, rest.size() - 2));
      }
    }
  }

  std::optional<std::string> street;
  std::optional<std::string> city;
  if (const auto comma = rest.rfind(','); comma != std::string::npos) {
    street = util::CollapseWhitespace(rest.substr(0, comma));
    city   = util::CollapseWhitespace(rest.substr(comma + 1));
  } else {
    street = rest;
  }

  if (street) {
    street = NormalizeStreet(*street);
  }
  return Assemble(std::move(street), std::move(city), std::move(state), std::move(zip_code));
}

} // namespace

std::string NormalizeStreet(std::string_view street) {
  auto words = util::SplitWords(util::ToUpper(street));
  for (auto& word : words) {
    word = Lookup(StreetTypes(), word);
    word = Lookup(Directions(), word);
    word = Lookup(UnitTypes(), word);
  }

  std::string joined;
  for (char c : util::JoinWords(words)) {
    if (c != '.') {
      joined.push_back(c);
    }
  }

  // POBOX, P O BOX and P.O. BOX all become PO BOX.
  words = util::SplitWords(joined);
  std::vector<std::string> out;
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (words[i] == "POBOX") {
      out.emplace_back("PO");
      out.emplace_back("BOX");
      continue;
    }
    if (words[i] == "P" && i + 2 < words.size() && words[i + 1] == "O" && words[i + 2] == "BOX") {
      out.emplace_back("PO");
      ++i;
      continue;
    }
    out.push_back(words[i]);
  }
  return util::JoinWords(out);
}

std::string NormalizeState(std::string_view state) {
  auto upper = util::CollapseWhitespace(util::ToUpper(state));
  if (upper.size() == 2) {
    return upper;
  }
  if (auto it = StateNames().find(upper); it != StateNames().end()) {
    return it->second;
  }
  return upper.substr(0, 2);
}

std::string NormalizeZip(std::string_view zip_code) {
  std::string digits;
  for (char c : zip_code) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits.push_back(c);
    }
  }
  return digits.size() >= 5 ? digits.substr(0, 5) : digits;
}

std::optional<ParsedAddress> CanonicalizeAddress(std::optional<std::string_view> raw, std::optional<std::string_view> city,
                                                 std::optional<std::string_view> state, std::optional<std::string_view> zip_code) {
  const bool has_street     = raw && !util::CollapseWhitespace(*raw).empty();
  const bool has_components = (city && !city->empty()) || (state && !state->empty()) || (zip_code && !zip_code->empty());

  if (!has_street && !has_components) {
    return std::nullopt;
  }

  ParsedAddress parsed;
  if (has_components) {
    parsed = Assemble(has_street ? std::optional<std::string>(NormalizeStreet(*raw)) : std::nullopt,
                      city && !city->empty() ? std::optional<std::string>(util::CollapseWhitespace(util::ToUpper(*city))) : std::nullopt,
                      state && !state->empty() ? std::optional<std::string>(NormalizeState(*state)) : std::nullopt,
                      zip_code && !zip_code->empty() ? std::optional<std::string>(NormalizeZip(*zip_code)) : std::nullopt);
  } else {
    parsed = ParseFullAddress(*raw);
  }

  if (parsed.normalized.empty()) {
    return std::nullopt;
  }
  return parsed;
}

bool AddressesMatch(std::string_view a, std::string_view b, double threshold) {
  auto parsed_a = CanonicalizeAddress(a);
  auto parsed_b = CanonicalizeAddress(b);
  if (!parsed_a || !parsed_b) {
    return false;
  }

  if (parsed_a->normalized == parsed_b->normalized) {
    return true;
  }

  if (parsed_a->zip_code && parsed_b->zip_code && *parsed_a->zip_code != *parsed_b->zip_code) {
    return false;
  }

  if (parsed_a->street && parsed_b->street) {
    return match::Similarity(*parsed_a->street, *parsed_b->street) >= threshold;
  }
  return false;
}

} // namespace fraudit::normalize
