#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fraudit::normalize {

struct ParsedAddress {
  std::optional<std::string> street;
  std::optional<std::string> city;
  std::optional<std::string> state;
  std::optional<std::string> zip_code;
  std::string                normalized;
};

/*
  Canonicalizes an address given either as a single line
  ("100 North Main Street, Austin, TX 78701-1234") or as separate
  components. When any of city/state/zip is supplied, raw is taken to be the
  street line only. Returns nullopt when nothing remains.
*/
std::optional<ParsedAddress> CanonicalizeAddress(std::optional<std::string_view> raw,
                                                 std::optional<std::string_view> city     = std::nullopt,
                                                 std::optional<std::string_view> state    = std::nullopt,
                                                 std::optional<std::string_view> zip_code = std::nullopt);

std::string NormalizeStreet(std::string_view street);
std::string NormalizeState(std::string_view state);
std::string NormalizeZip(std::string_view zip_code);

// Equal normalized forms match; differing ZIPs never match; otherwise the
// street similarity decides.
bool AddressesMatch(std::string_view a, std::string_view b, double threshold = 0.85);

} // namespace fraudit::normalize
