// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace blockledger {
namespace chain {

/**
 * Compute the Merkle root of an ordered list of transaction ids
 *
 * Consecutive ids are paired left to right with crypto::HashPair; an odd
 * trailing id is paired with itself. Levels are reduced until one digest
 * remains. A single id is returned as is, and an empty list has no root.
 */
std::optional<std::string> ComputeMerkleRoot(std::vector<std::string> ids);

} // namespace chain
} // namespace blockledger
