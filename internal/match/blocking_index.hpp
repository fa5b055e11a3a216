#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/entity.hpp"

namespace fraudit::match {

/*
  Immutable map from blocking key to the entities carrying it.

  Entities are indexed in the order given, which callers keep sorted by id,
  so buckets over max_block_size keep their lowest ids. Safe to share
  read-only across worker threads.
*/
class BlockingIndex {
 public:
  BlockingIndex(const std::vector<const model::CanonicalEntity*>& entities, std::size_t key_length, std::size_t max_block_size);

  // Positions (into the indexed vector) of every entity sharing a key with
  // normalized_name, ascending and unique.
  std::vector<std::size_t> Candidates(std::string_view normalized_name) const;

  const model::CanonicalEntity& At(std::size_t position) const {
    return *entities_[position];
  }

  std::size_t TruncatedBlocks() const {
    return truncated_blocks_;
  }

 private:
  std::vector<const model::CanonicalEntity*>                entities_;
  std::unordered_map<std::string, std::vector<std::size_t>> blocks_;
  std::size_t                                               key_length_;
  std::size_t                                               truncated_blocks_ = 0;
};

} // namespace fraudit::match
