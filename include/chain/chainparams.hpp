// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/reward.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace blockledger {
namespace chain {

/**
 * Chain type enumeration
 */
enum class ChainType {
  MAIN,   // Default schedule
  REGTEST // Short intervals for local testing
};

/**
 * Consensus parameters
 * Reward and difficulty schedule, all intervals in blocks
 */
struct ConsensusParams {
  Reward initialReward;                 // Reward of genesis and the first blocks
  int64_t nRewardHalvingInterval;       // Reward halves every N blocks
  int64_t nDifficultyBitsInterval;      // difficulty_bits grows every N blocks
  int64_t nDifficultyRecomputeInterval; // difficulty doubles every N blocks

  // Exclusive bound of the nonce search
  uint64_t nMaxNonce;
};

/**
 * ChainParams - Chain-specific parameters
 */
class ChainParams {
public:
  ChainParams() = default;
  virtual ~ChainParams() = default;

  // Accessors
  const ConsensusParams &GetConsensus() const { return consensus; }
  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;

  // Fixed addresses of the reward transaction
  const std::string &RewardSender() const { return rewardSender; }
  const std::string &RewardRecipient() const { return rewardRecipient; }

  // Mutators (for CLI overrides); intervals must be positive
  void SetMaxNonce(uint64_t max_nonce) { consensus.nMaxNonce = max_nonce; }
  void SetRewardHalvingInterval(int64_t blocks);
  void SetDifficultyInterval(int64_t blocks);

  // Factory methods
  static std::unique_ptr<ChainParams> CreateMainNet();
  static std::unique_ptr<ChainParams> CreateRegTest();
  static std::unique_ptr<ChainParams> Create(ChainType type);

protected:
  ConsensusParams consensus{};
  ChainType chainType{ChainType::MAIN};
  std::string rewardSender{"00000000000000000000x0"};
  std::string rewardRecipient{"00000000000000000000x1"};
};

/**
 * MainNet parameters
 */
class CMainParams : public ChainParams {
public:
  CMainParams();
};

/**
 * RegTest parameters
 */
class CRegTestParams : public ChainParams {
public:
  CRegTestParams();
};

} // namespace chain
} // namespace blockledger
