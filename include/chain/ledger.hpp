// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/reward.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blockledger {
namespace chain {

class BlockStore;
class ChainParams;

// Snapshot of the values the next Mine() would use
struct MiningInfo {
  int64_t blocks{0};
  Reward next_reward;
  int next_difficulty_bits{0};
  uint64_t next_difficulty{1};
  double last_elapsed_time{0};
  double last_hash_power{0};
  size_t pending_transactions{0};
};

/**
 * Ledger - pending pool, block assembly and sealing
 *
 * Mine() builds the candidate on top of the store's last block, searches a
 * nonce on the calling thread and inserts the sealed block into the store.
 * The pool is only cleared once the store accepted the block.
 *
 * THREAD SAFETY: every public method except Interrupt() takes ledger_mutex_,
 * so concurrent miners queue behind each other. Interrupt() only sets an
 * atomic flag and can stop a search running on another thread.
 *
 * The store and params must outlive the ledger.
 */
class Ledger {
public:
  Ledger(BlockStore &store, const ChainParams &params);

  Ledger(const Ledger &) = delete;
  Ledger &operator=(const Ledger &) = delete;

  // Throws std::invalid_argument (pool unchanged) for a NaN or infinite amount
  TransactionRecord AddTransaction(const std::string &sender,
                                   const std::string &recipient,
                                   double amount);

  // Throws mining::MiningError (pool unchanged) when the search is exhausted
  // or interrupted, BlockStoreError when the store rejects the block
  Block Mine();

  // Drops every block, clears the pool and stores a new genesis block
  Block Reset();

  // Stops the running search (if any) and every later one until
  // ClearInterrupt()
  void Interrupt();
  void ClearInterrupt();
  bool IsInterrupted() const { return interrupt_.load(); }

  // First height failing linkage, Merkle, count or proof-of-work checks;
  // nullopt if the whole chain is valid
  std::optional<int64_t> VerifyChain() const;

  std::vector<TransactionRecord> GetPendingTransactions() const;
  MiningInfo GetMiningInfo() const;

private:
  // Caller holds ledger_mutex_
  Block BuildCandidate(const std::optional<Block> &prev,
                       std::vector<TransactionRecord> txs) const;
  Block SealCandidate(Block candidate);

  BlockStore &store_;
  const ChainParams &params_;

  mutable std::mutex ledger_mutex_;
  std::vector<TransactionRecord> pending_;

  // Metrics of the last successful search; hash power is only refreshed when
  // the search took measurable time
  double last_elapsed_time_{0};
  double last_hash_power_{0};

  std::atomic<bool> interrupt_{false};
};

} // namespace chain
} // namespace blockledger
