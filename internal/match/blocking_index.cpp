#include "blocking_index.hpp"

#include <algorithm>

#include "internal/normalize/name_normalizer.hpp"
#include "internal/observability/logging.hpp"

namespace fraudit::match {

using fraudit::observability::IntField;
using fraudit::observability::StringField;

BlockingIndex::BlockingIndex(const std::vector<const model::CanonicalEntity*>& entities, std::size_t key_length,
                             std::size_t max_block_size)
    : entities_(entities), key_length_(key_length) {
  for (std::size_t position = 0; position < entities_.size(); ++position) {
    const auto& name = entities_[position]->normalized_name;
    if (!name) {
      continue;
    }
    for (auto& key : normalize::BlockingKeys(*name, key_length_)) {
      blocks_[std::move(key)].push_back(position);
    }
  }

  if (max_block_size == 0) {
    return;
  }
  for (auto& [key, members] : blocks_) {
    if (members.size() <= max_block_size) {
      continue;
    }
    FRAUDIT_LOG_WARN("blocking bucket truncated",
                     {StringField("key", key), IntField("size", static_cast<std::int64_t>(members.size())),
                      IntField("kept", static_cast<std::int64_t>(max_block_size))});
    members.resize(max_block_size);
    ++truncated_blocks_;
  }
}

std::vector<std::size_t> BlockingIndex::Candidates(std::string_view normalized_name) const {
  std::vector<std::size_t> candidates;
  for (const auto& key : normalize::BlockingKeys(normalized_name, key_length_)) {
    auto it = blocks_.find(key);
    if (it == blocks_.end()) {
      continue;
    }
    candidates.insert(candidates.end(), it->second.begin(), it->second.end());
  }
  std::sort(candidates.begin(), candidates.end());
  candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());
  return candidates;
}

} // namespace fraudit::match
