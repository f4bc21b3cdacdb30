// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/ledger.hpp"
#include "chain/block_store.hpp"
#include "chain/chainparams.hpp"
#include "chain/merkle.hpp"
#include "chain/miner.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace blockledger {
namespace chain {

Ledger::Ledger(BlockStore &store, const ChainParams &params)
    : store_(store), params_(params) {}

TransactionRecord Ledger::AddTransaction(const std::string &sender,
                                         const std::string &recipient,
                                         double amount) {
  if (!std::isfinite(amount)) {
    throw std::invalid_argument("transaction amount must be finite");
  }

  TransactionRecord record =
      TransactionRecord::Create(Transaction{sender, recipient, amount});

  std::lock_guard<std::mutex> lock(ledger_mutex_);
  pending_.push_back(record);
  LOG_CHAIN_DEBUG("Transaction {} added to the pool ({} pending)",
                  record.transaction_id.substr(0, 16), pending_.size());
  return record;
}

Block Ledger::BuildCandidate(const std::optional<Block> &prev,
                             std::vector<TransactionRecord> txs) const {
  const ConsensusParams &consensus = params_.GetConsensus();
  const Block *pindexPrev = prev ? &*prev : nullptr;

  Block candidate;
  candidate.height = prev ? prev->height + 1 : 1;
  candidate.previous_hash =
      prev ? std::optional<std::string>(prev->GetHash()) : std::nullopt;
  candidate.block_reward = consensus::GetNextBlockReward(pindexPrev, consensus);
  candidate.difficulty_bits =
      consensus::GetNextDifficultyBits(pindexPrev, consensus);
  candidate.difficulty = consensus::GetNextDifficulty(pindexPrev, consensus);

  // Reward transaction goes last, after the pool in insertion order
  txs.push_back(TransactionRecord::Create(
      Transaction{params_.RewardSender(), params_.RewardRecipient(),
                  candidate.block_reward.ToDouble()}));

  candidate.transactions = std::move(txs);
  candidate.number_of_transactions =
      static_cast<int64_t>(candidate.transactions.size());
  candidate.merkle_root = ComputeMerkleRoot(candidate.GetTransactionIds());
  candidate.timestamp = util::FormatCTime(util::GetTime());
  return candidate;
}

Block Ledger::SealCandidate(Block candidate) {
  LOG_CHAIN_DEBUG("Mining block #{} (bits: {}, difficulty: {}, reward: {})",
                  candidate.height, candidate.difficulty_bits,
                  candidate.difficulty, candidate.block_reward.ToString());

  const std::string serialized = candidate.GetCandidateSerialization();

  auto start = std::chrono::steady_clock::now();
  mining::NonceSearchResult result =
      mining::FindNonce(serialized, candidate.difficulty_bits,
                        params_.GetConsensus().nMaxNonce, &interrupt_);
  double elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  if (!result.Found()) {
    LOG_CHAIN_WARN("Mining block #{} failed: nonce search {} after {} hashes",
                   candidate.height, mining::StatusToString(result.status),
                   result.hashes);
    throw mining::MiningError(result.status,
                              "nonce search " +
                                  mining::StatusToString(result.status) +
                                  " for block #" +
                                  std::to_string(candidate.height));
  }

  candidate.nonce = result.nonce;
  candidate.elapsed_time = elapsed;
  candidate.hash_power = last_hash_power_;
  if (elapsed > 0) {
    candidate.hash_power = static_cast<double>(result.nonce) / elapsed;
  }
  return candidate;
}

Block Ledger::Mine() {
  std::lock_guard<std::mutex> lock(ledger_mutex_);

  std::optional<Block> prev = store_.GetLast();
  Block block = SealCandidate(BuildCandidate(prev, pending_));

  store_.Insert(block);

  last_elapsed_time_ = block.elapsed_time;
  last_hash_power_ = block.hash_power;
  pending_.clear();

  LOG_CHAIN_INFO("Block #{} added to the chain", block.height);
  LOG_CHAIN_DEBUG("  nonce: {}, elapsed: {:.6f}s, hash power: {:.2f} H/s",
                  block.nonce, block.elapsed_time, block.hash_power);
  return block;
}

Block Ledger::Reset() {
  std::lock_guard<std::mutex> lock(ledger_mutex_);

  store_.DropAll();
  pending_.clear();
  last_elapsed_time_ = 0;
  last_hash_power_ = 0;

  Block genesis;
  genesis.height = 1;
  genesis.previous_hash = std::nullopt;
  genesis.merkle_root = std::nullopt;
  genesis.number_of_transactions = 0;
  genesis.nonce = 0;
  genesis.difficulty_bits = 0;
  genesis.difficulty = 1;
  genesis.block_reward = params_.GetConsensus().initialReward;
  genesis.timestamp = util::FormatCTime(util::GetTime());

  store_.Insert(genesis);
  LOG_CHAIN_INFO("Chain reset, genesis block stored");
  return genesis;
}

void Ledger::Interrupt() { interrupt_.store(true); }

void Ledger::ClearInterrupt() { interrupt_.store(false); }

std::optional<int64_t> Ledger::VerifyChain() const {
  std::lock_guard<std::mutex> lock(ledger_mutex_);

  const ConsensusParams &consensus = params_.GetConsensus();
  const int64_t count = store_.Count();
  std::optional<Block> prev;

  for (int64_t height = 1; height <= count; ++height) {
    std::optional<Block> block = store_.FindByHeight(height);
    if (!block) {
      LOG_CHAIN_ERROR("VerifyChain: block #{} missing", height);
      return height;
    }

    if (block->height != height) {
      LOG_CHAIN_ERROR("VerifyChain: block #{} reports height {}", height,
                      block->height);
      return height;
    }

    std::optional<std::string> expected_prev =
        prev ? std::optional<std::string>(prev->GetHash()) : std::nullopt;
    if (block->previous_hash != expected_prev) {
      LOG_CHAIN_ERROR("VerifyChain: block #{} does not link to its parent",
                      height);
      return height;
    }

    if (block->number_of_transactions !=
        static_cast<int64_t>(block->transactions.size())) {
      LOG_CHAIN_ERROR("VerifyChain: block #{} transaction count mismatch",
                      height);
      return height;
    }

    for (const auto &tx : block->transactions) {
      if (tx.transaction_id != tx.info.GetId()) {
        LOG_CHAIN_ERROR("VerifyChain: block #{} transaction {} does not match "
                        "its payload",
                        height, tx.transaction_id.substr(0, 16));
        return height;
      }
    }

    if (block->merkle_root != ComputeMerkleRoot(block->GetTransactionIds())) {
      LOG_CHAIN_ERROR("VerifyChain: block #{} merkle root mismatch", height);
      return height;
    }

    // Genesis is checked against the schedule with no parent
    const Block *pindexPrev = prev ? &*prev : nullptr;
    if (block->block_reward !=
            consensus::GetNextBlockReward(pindexPrev, consensus) ||
        block->difficulty_bits !=
            consensus::GetNextDifficultyBits(pindexPrev, consensus) ||
        block->difficulty !=
            consensus::GetNextDifficulty(pindexPrev, consensus)) {
      LOG_CHAIN_ERROR("VerifyChain: block #{} does not follow the reward and "
                      "difficulty schedule",
                      height);
      return height;
    }

    if (!consensus::CheckProofOfWork(*block)) {
      LOG_CHAIN_ERROR("VerifyChain: block #{} fails proof-of-work", height);
      return height;
    }

    prev = std::move(block);
  }

  LOG_CHAIN_DEBUG("VerifyChain: {} blocks valid", count);
  return std::nullopt;
}

std::vector<TransactionRecord> Ledger::GetPendingTransactions() const {
  std::lock_guard<std::mutex> lock(ledger_mutex_);
  return pending_;
}

MiningInfo Ledger::GetMiningInfo() const {
  std::lock_guard<std::mutex> lock(ledger_mutex_);

  const ConsensusParams &consensus = params_.GetConsensus();
  std::optional<Block> prev = store_.GetLast();
  const Block *pindexPrev = prev ? &*prev : nullptr;

  MiningInfo info;
  info.blocks = store_.Count();
  info.next_reward = consensus::GetNextBlockReward(pindexPrev, consensus);
  info.next_difficulty_bits =
      consensus::GetNextDifficultyBits(pindexPrev, consensus);
  info.next_difficulty = consensus::GetNextDifficulty(pindexPrev, consensus);
  info.last_elapsed_time = last_elapsed_time_;
  info.last_hash_power = last_hash_power_;
  info.pending_transactions = pending_.size();
  return info;
}

} // namespace chain
} // namespace blockledger
