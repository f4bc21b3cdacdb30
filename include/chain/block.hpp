// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/reward.hpp"
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace blockledger {
namespace chain {

// Transaction payload: {sender, recipient, amount}
struct Transaction {
  std::string sender;
  std::string recipient;
  double amount{0};

  [[nodiscard]] nlohmann::json ToJson() const;
  static Transaction FromJson(const nlohmann::json &j);

  // Canonical hash of ToJson()
  [[nodiscard]] std::string GetId() const;
};

// Pool and block entry: {transaction_id, transaction_info}
struct TransactionRecord {
  std::string transaction_id;
  Transaction info;

  static TransactionRecord Create(const Transaction &tx);

  [[nodiscard]] nlohmann::json ToJson() const;
  static TransactionRecord FromJson(const nlohmann::json &j);
};

/**
 * Block - one sealed (or candidate) block record
 *
 * The JSON form produced by ToJson() is the persisted record; its canonical
 * hash is what the next block stores in previous_hash. CandidateJson() is the
 * same record without the fields that are only known after sealing (nonce,
 * elapsed_time, hash_power); its canonical serialization is the
 * proof-of-work pre-image prefix.
 */
class Block {
public:
  int64_t height{0};
  std::optional<std::string> previous_hash; // null for genesis
  std::optional<std::string> merkle_root;   // null iff no transactions
  std::vector<TransactionRecord> transactions;
  int64_t number_of_transactions{0};
  uint64_t nonce{0};
  int difficulty_bits{0};
  uint64_t difficulty{1};
  Reward block_reward;
  std::string timestamp;
  double elapsed_time{0};  // seconds spent searching the nonce
  double hash_power{0};    // hashes per second

  [[nodiscard]] bool IsGenesis() const { return height == 1; }

  [[nodiscard]] std::vector<std::string> GetTransactionIds() const;

  [[nodiscard]] nlohmann::json ToJson() const;
  [[nodiscard]] nlohmann::json CandidateJson() const;

  // Throws nlohmann::json::exception or std::invalid_argument on malformed
  // records
  static Block FromJson(const nlohmann::json &j);

  // Canonical hash of the full record
  [[nodiscard]] std::string GetHash() const;

  // Canonical serialization of CandidateJson()
  [[nodiscard]] std::string GetCandidateSerialization() const;
};

// Integer when whole, JSON number otherwise
nlohmann::json RewardToJson(const Reward &reward);

// JSON names of the block fields
namespace field {
constexpr const char *HEIGHT = "height";
constexpr const char *PREVIOUS_HASH = "previous_hash";
constexpr const char *MERKLE_ROOT = "merkle_root";
constexpr const char *TRANSACTIONS = "transactions";
constexpr const char *NUMBER_OF_TRANSACTIONS = "number_of_transactions";
constexpr const char *NONCE = "nonce";
constexpr const char *DIFFICULTY_BITS = "difficulty_bits";
constexpr const char *DIFFICULTY = "difficulty";
constexpr const char *BLOCK_REWARD = "block_reward";
constexpr const char *TIMESTAMP = "timestamp";
constexpr const char *ELAPSED_TIME = "elapsed_time";
constexpr const char *HASH_POWER = "hash_power";
} // namespace field

} // namespace chain
} // namespace blockledger
