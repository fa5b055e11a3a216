#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fraudit::normalize {

/*
  Canonical form of an organization or person name.

  Uppercase, whitespace collapsed, business suffixes standardized, common
  abbreviations expanded, punctuation removed, '&' spelled AND and filler
  words dropped unless the name is a single word. Pure and deterministic.
  Returns nullopt for absent input or when nothing survives.
*/
std::optional<std::string> CanonicalizeName(std::optional<std::string_view> raw);

/*
  Blocking keys of a normalized name: "P:" + first n bytes and "S:" + last
  n bytes. Names shorter than n yield a single whole-name key per side.

  Two names are compared only when they share a key, so a pair that differs
  in both its first n and its last n bytes is never scored.
*/
std::vector<std::string> BlockingKeys(std::string_view normalized_name, std::size_t n);

} // namespace fraudit::normalize
