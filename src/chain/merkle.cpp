// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/merkle.hpp"
#include "chain/hasher.hpp"
#include <utility>

namespace blockledger {
namespace chain {

std::optional<std::string> ComputeMerkleRoot(std::vector<std::string> ids) {
  if (ids.empty()) {
    return std::nullopt;
  }

  while (ids.size() > 1) {
    std::vector<std::string> level;
    level.reserve((ids.size() + 1) / 2);
    for (size_t i = 0; i < ids.size(); i += 2) {
      const std::string &left = ids[i];
      const std::string &right = (i + 1 < ids.size()) ? ids[i + 1] : ids[i];
      level.push_back(crypto::HashPair(left, right));
    }
    ids = std::move(level);
  }
  return std::move(ids.front());
}

} // namespace chain
} // namespace blockledger
