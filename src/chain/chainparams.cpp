// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chainparams.hpp"
#include <stdexcept>

namespace blockledger {
namespace chain {

std::string ChainParams::GetChainTypeString() const {
  switch (chainType) {
  case ChainType::MAIN:
    return "main";
  case ChainType::REGTEST:
    return "regtest";
  }
  return "unknown";
}

void ChainParams::SetRewardHalvingInterval(int64_t blocks) {
  if (blocks <= 0) {
    throw std::invalid_argument("reward halving interval must be positive");
  }
  consensus.nRewardHalvingInterval = blocks;
}

void ChainParams::SetDifficultyInterval(int64_t blocks) {
  if (blocks <= 0) {
    throw std::invalid_argument("difficulty interval must be positive");
  }
  consensus.nDifficultyBitsInterval = blocks;
  consensus.nDifficultyRecomputeInterval = blocks;
}

std::unique_ptr<ChainParams> ChainParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateRegTest() {
  return std::make_unique<CRegTestParams>();
}

std::unique_ptr<ChainParams> ChainParams::Create(ChainType type) {
  switch (type) {
  case ChainType::MAIN:
    return CreateMainNet();
  case ChainType::REGTEST:
    return CreateRegTest();
  }
  throw std::runtime_error("Unknown chain type");
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams() {
  chainType = ChainType::MAIN;

  consensus.initialReward = Reward::FromInteger(50);
  consensus.nRewardHalvingInterval = 1000;
  consensus.nDifficultyBitsInterval = 100;
  consensus.nDifficultyRecomputeInterval = 100;
  consensus.nMaxNonce = 1ULL << 32;
}

// ============================================================================
// RegTest Parameters (Local testing)
// ============================================================================

CRegTestParams::CRegTestParams() {
  chainType = ChainType::REGTEST;

  // Same reward, but halvings and difficulty steps are reached quickly
  consensus.initialReward = Reward::FromInteger(50);
  consensus.nRewardHalvingInterval = 10;
  consensus.nDifficultyBitsInterval = 5;
  consensus.nDifficultyRecomputeInterval = 5;
  consensus.nMaxNonce = 1ULL << 32;
}

} // namespace chain
} // namespace blockledger
