// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/pow.hpp"
#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "chain/hasher.hpp"
#include <string>

namespace blockledger {
namespace consensus {

namespace {

bool IsBoundary(int64_t height, int64_t interval) {
  return interval > 0 && height % interval == 0;
}

} // namespace

chain::Reward GetNextBlockReward(const chain::Block *pindexPrev,
                                 const chain::ConsensusParams &params) {
  if (pindexPrev == nullptr) {
    return params.initialReward;
  }

  static const chain::Reward kOne = chain::Reward::FromInteger(1);
  const chain::Reward &prev = pindexPrev->block_reward;

  if (prev > kOne &&
      IsBoundary(pindexPrev->height, params.nRewardHalvingInterval)) {
    return prev.Halved();
  }
  if (prev < kOne) {
    return chain::Reward();
  }
  return prev;
}

int GetNextDifficultyBits(const chain::Block *pindexPrev,
                          const chain::ConsensusParams &params) {
  if (pindexPrev == nullptr) {
    return 0;
  }
  if (IsBoundary(pindexPrev->height, params.nDifficultyBitsInterval)) {
    return pindexPrev->difficulty_bits + 1;
  }
  return pindexPrev->difficulty_bits;
}

uint64_t GetNextDifficulty(const chain::Block *pindexPrev,
                           const chain::ConsensusParams &params) {
  if (pindexPrev == nullptr) {
    return 1;
  }
  if (IsBoundary(pindexPrev->height, params.nDifficultyRecomputeInterval)) {
    const int bits = pindexPrev->difficulty_bits + 1;
    if (bits >= 63) {
      return uint64_t{1} << 63;
    }
    return uint64_t{1} << bits;
  }
  return pindexPrev->difficulty;
}

uint256 GetTargetFromBits(int nBits) {
  uint256 target;
  if (nBits >= 1 && nBits <= 256) {
    target.SetBit(static_cast<unsigned int>(256 - nBits));
  }
  return target;
}

bool CheckProofOfWork(const uint256 &hash, int nBits) {
  if (nBits <= 0) {
    return true;
  }
  if (nBits > 256) {
    return false;
  }
  return hash < GetTargetFromBits(nBits);
}

uint256 GetProofOfWorkHash(const std::string &candidate, uint64_t nonce) {
  return crypto::Sha256Hasher()
      .Write(candidate)
      .Write(std::to_string(nonce))
      .Finalize();
}

bool CheckProofOfWork(const chain::Block &block) {
  const uint256 hash =
      GetProofOfWorkHash(block.GetCandidateSerialization(), block.nonce);
  return CheckProofOfWork(hash, block.difficulty_bits);
}

} // namespace consensus
} // namespace blockledger
