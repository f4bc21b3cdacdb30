// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block.hpp"
#include "chain/hasher.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace blockledger {
namespace chain {

namespace {

// Whole amounts are written as JSON integers so that 50 and 50.0 hash alike
nlohmann::json AmountToJson(double amount) {
  constexpr double kMaxExactInteger = 9007199254740992.0; // 2^53
  if (std::trunc(amount) == amount && std::fabs(amount) < kMaxExactInteger) {
    return static_cast<int64_t>(amount);
  }
  return amount;
}

Reward RewardFromJson(const nlohmann::json &j) {
  if (j.is_number_unsigned() || j.is_number_integer()) {
    return Reward::FromInteger(j.get<int64_t>());
  }
  if (j.is_number_float()) {
    return Reward::FromDouble(j.get<double>());
  }
  throw std::invalid_argument("block_reward must be a number");
}

uint64_t UnsignedFromJson(const nlohmann::json &j, const char *name) {
  if (j.is_number_integer() && !j.is_number_unsigned() &&
      j.get<int64_t>() < 0) {
    throw std::invalid_argument(std::string(name) + " cannot be negative");
  }
  if (j.is_number_float()) {
    throw std::invalid_argument(std::string(name) + " must be an integer");
  }
  return j.get<uint64_t>();
}

nlohmann::json OptionalToJson(const std::optional<std::string> &value) {
  if (value) {
    return *value;
  }
  return nullptr;
}

std::optional<std::string> OptionalFromJson(const nlohmann::json &j) {
  if (j.is_null()) {
    return std::nullopt;
  }
  return j.get<std::string>();
}

} // namespace

nlohmann::json RewardToJson(const Reward &reward) {
  if (reward.IsWhole()) {
    return reward.Mantissa();
  }
  return reward.ToDouble();
}

nlohmann::json Transaction::ToJson() const {
  return nlohmann::json{{"sender", sender},
                        {"recipient", recipient},
                        {"amount", AmountToJson(amount)}};
}

Transaction Transaction::FromJson(const nlohmann::json &j) {
  Transaction tx;
  tx.sender = j.at("sender").get<std::string>();
  tx.recipient = j.at("recipient").get<std::string>();
  tx.amount = j.at("amount").get<double>();
  return tx;
}

std::string Transaction::GetId() const { return crypto::HashJson(ToJson()); }

TransactionRecord TransactionRecord::Create(const Transaction &tx) {
  return TransactionRecord{tx.GetId(), tx};
}

nlohmann::json TransactionRecord::ToJson() const {
  return nlohmann::json{{"transaction_id", transaction_id},
                        {"transaction_info", info.ToJson()}};
}

TransactionRecord TransactionRecord::FromJson(const nlohmann::json &j) {
  TransactionRecord record;
  record.transaction_id = j.at("transaction_id").get<std::string>();
  record.info = Transaction::FromJson(j.at("transaction_info"));
  return record;
}

std::vector<std::string> Block::GetTransactionIds() const {
  std::vector<std::string> ids;
  ids.reserve(transactions.size());
  for (const auto &tx : transactions) {
    ids.push_back(tx.transaction_id);
  }
  return ids;
}

nlohmann::json Block::CandidateJson() const {
  nlohmann::json txs = nlohmann::json::array();
  for (const auto &tx : transactions) {
    txs.push_back(tx.ToJson());
  }

  nlohmann::json j;
  j[field::HEIGHT] = height;
  j[field::PREVIOUS_HASH] = OptionalToJson(previous_hash);
  j[field::MERKLE_ROOT] = OptionalToJson(merkle_root);
  j[field::TRANSACTIONS] = std::move(txs);
  j[field::NUMBER_OF_TRANSACTIONS] = number_of_transactions;
  j[field::DIFFICULTY_BITS] = difficulty_bits;
  j[field::DIFFICULTY] = difficulty;
  j[field::BLOCK_REWARD] = RewardToJson(block_reward);
  j[field::TIMESTAMP] = timestamp;
  return j;
}

nlohmann::json Block::ToJson() const {
  nlohmann::json j = CandidateJson();
  j[field::NONCE] = nonce;
  j[field::ELAPSED_TIME] = elapsed_time;
  j[field::HASH_POWER] = hash_power;
  return j;
}

Block Block::FromJson(const nlohmann::json &j) {
  Block block;
  block.height = j.at(field::HEIGHT).get<int64_t>();
  if (block.height < 1) {
    throw std::invalid_argument("block height must be at least 1");
  }
  block.previous_hash = OptionalFromJson(j.at(field::PREVIOUS_HASH));
  block.merkle_root = OptionalFromJson(j.at(field::MERKLE_ROOT));
  for (const auto &tx : j.at(field::TRANSACTIONS)) {
    block.transactions.push_back(TransactionRecord::FromJson(tx));
  }
  block.number_of_transactions =
      j.at(field::NUMBER_OF_TRANSACTIONS).get<int64_t>();
  block.nonce = UnsignedFromJson(j.at(field::NONCE), field::NONCE);
  const int64_t bits = j.at(field::DIFFICULTY_BITS).get<int64_t>();
  if (bits < 0) {
    throw std::invalid_argument("difficulty_bits cannot be negative");
  }
  if (bits > std::numeric_limits<int>::max()) {
    throw std::invalid_argument("difficulty_bits out of range");
  }
  block.difficulty_bits = static_cast<int>(bits);
  block.difficulty =
      UnsignedFromJson(j.at(field::DIFFICULTY), field::DIFFICULTY);
  block.block_reward = RewardFromJson(j.at(field::BLOCK_REWARD));
  block.timestamp = j.at(field::TIMESTAMP).get<std::string>();
  block.elapsed_time = j.at(field::ELAPSED_TIME).get<double>();
  block.hash_power = j.at(field::HASH_POWER).get<double>();
  return block;
}

std::string Block::GetHash() const { return crypto::HashJson(ToJson()); }

std::string Block::GetCandidateSerialization() const {
  return crypto::CanonicalSerialize(CandidateJson());
}

} // namespace chain
} // namespace blockledger
