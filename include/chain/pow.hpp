// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/reward.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <string>

namespace blockledger {

// Forward declarations
namespace chain {
class Block;
struct ConsensusParams;
} // namespace chain

namespace consensus {

// Reward, difficulty_bits and difficulty schedule.
//
// Each function takes the previous block (nullptr when the next block is
// genesis) and is computed on its own. In particular GetNextDifficulty keeps
// its own recurrence 2^(prev.difficulty_bits + 1) on recompute boundaries and
// is not derived from GetNextDifficultyBits.

chain::Reward GetNextBlockReward(const chain::Block *pindexPrev,
                                 const chain::ConsensusParams &params);

int GetNextDifficultyBits(const chain::Block *pindexPrev,
                          const chain::ConsensusParams &params);

// Saturates at 2^63
uint64_t GetNextDifficulty(const chain::Block *pindexPrev,
                           const chain::ConsensusParams &params);

// Target 2^(256 - bits) for bits in [1, 256]
uint256 GetTargetFromBits(int nBits);

// CONSENSUS-CRITICAL: hash < 2^(256 - bits). Every hash passes at bits <= 0
// and none passes above 256.
bool CheckProofOfWork(const uint256 &hash, int nBits);

// Recomputes SHA-256(candidate serialization || decimal nonce) of a sealed
// block and checks it against the block's own difficulty_bits
bool CheckProofOfWork(const chain::Block &block);

// Digest a nonce search attempt produces for the given pre-image prefix
uint256 GetProofOfWorkHash(const std::string &candidate, uint64_t nonce);

} // namespace consensus
} // namespace blockledger
