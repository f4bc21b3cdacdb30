// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block_store.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <exception>
#include <nlohmann/json.hpp>
#include <utility>

namespace blockledger {
namespace chain {

namespace {

constexpr int STORE_FORMAT_VERSION = 1;

template <typename T> int Cmp(const T &a, const T &b) {
  return a < b ? -1 : (b < a ? 1 : 0);
}

} // namespace

std::optional<BlockField> ParseBlockField(std::string_view name) {
  if (name == field::DIFFICULTY)
    return BlockField::DIFFICULTY;
  if (name == field::ELAPSED_TIME)
    return BlockField::ELAPSED_TIME;
  if (name == field::BLOCK_REWARD)
    return BlockField::BLOCK_REWARD;
  if (name == field::HASH_POWER)
    return BlockField::HASH_POWER;
  if (name == field::HEIGHT)
    return BlockField::HEIGHT;
  if (name == field::NONCE)
    return BlockField::NONCE;
  if (name == field::NUMBER_OF_TRANSACTIONS)
    return BlockField::NUMBER_OF_TRANSACTIONS;
  return std::nullopt;
}

int CompareBlocksByField(const Block &a, const Block &b, BlockField f) {
  switch (f) {
  case BlockField::DIFFICULTY:
    return Cmp(a.difficulty, b.difficulty);
  case BlockField::ELAPSED_TIME:
    return Cmp(a.elapsed_time, b.elapsed_time);
  case BlockField::BLOCK_REWARD:
    return a.block_reward.Compare(b.block_reward);
  case BlockField::HASH_POWER:
    return Cmp(a.hash_power, b.hash_power);
  case BlockField::HEIGHT:
    return Cmp(a.height, b.height);
  case BlockField::NONCE:
    return Cmp(a.nonce, b.nonce);
  case BlockField::NUMBER_OF_TRANSACTIONS:
    return Cmp(a.number_of_transactions, b.number_of_transactions);
  }
  return 0;
}

std::vector<Block> BlockStore::FindTopN(std::string_view name,
                                        size_t n) const {
  auto parsed = ParseBlockField(name);
  if (!parsed) {
    LOG_STORE_DEBUG("FindTopN: unknown field '{}'", name);
    return {};
  }
  return FindTopN(*parsed, n);
}

// ============================================================================
// MemoryBlockStore
// ============================================================================

void MemoryBlockStore::Insert(const Block &block) {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto expected = static_cast<int64_t>(blocks_.size()) + 1;
  if (block.height != expected) {
    LOG_STORE_ERROR("Rejected block at height {} (expected {})", block.height,
                    expected);
    throw BlockStoreError("block height " + std::to_string(block.height) +
                          " does not extend the chain (expected " +
                          std::to_string(expected) + ")");
  }

  blocks_.push_back(block);
  try {
    Persist(blocks_);
  } catch (...) {
    blocks_.pop_back();
    throw;
  }
  LOG_STORE_DEBUG("Stored block #{}", block.height);
}

int64_t MemoryBlockStore::Count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int64_t>(blocks_.size());
}

std::optional<Block> MemoryBlockStore::FindByHeight(int64_t height) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (height < 1 || height > static_cast<int64_t>(blocks_.size())) {
    return std::nullopt;
  }
  return blocks_[static_cast<size_t>(height - 1)];
}

std::vector<Block> MemoryBlockStore::FindTopN(BlockField f, size_t n) const {
  if (n == 0) {
    return {};
  }

  std::lock_guard<std::mutex> lock(mutex_);

  // blocks_ is in ascending height order, so a stable sort keeps ties that way
  std::vector<const Block *> order;
  order.reserve(blocks_.size());
  for (const auto &block : blocks_) {
    order.push_back(&block);
  }
  std::stable_sort(order.begin(), order.end(),
                   [f](const Block *a, const Block *b) {
                     return CompareBlocksByField(*a, *b, f) > 0;
                   });

  std::vector<Block> result;
  const size_t count = std::min(n, order.size());
  result.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    result.push_back(*order[i]);
  }
  return result;
}

void MemoryBlockStore::DropAll() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Block> previous;
  previous.swap(blocks_);
  try {
    Persist(blocks_);
  } catch (...) {
    blocks_.swap(previous);
    throw;
  }
  LOG_STORE_INFO("Dropped {} blocks", previous.size());
}

// ============================================================================
// JsonFileBlockStore
// ============================================================================

JsonFileBlockStore::JsonFileBlockStore(std::filesystem::path path)
    : path_(std::move(path)) {
  Load();
}

void JsonFileBlockStore::Persist(const std::vector<Block> &blocks) {
  using json = nlohmann::json;

  json root;
  root["version"] = STORE_FORMAT_VERSION;
  root["block_count"] = blocks.size();

  json array = json::array();
  for (const auto &block : blocks) {
    array.push_back(block.ToJson());
  }
  root["blocks"] = std::move(array);

  if (!util::atomic_write_file(path_, root.dump(2))) {
    LOG_STORE_ERROR("Failed to write block file {}", path_.string());
    throw BlockStoreError("failed to write " + path_.string());
  }
  LOG_STORE_DEBUG("Saved {} blocks to {}", blocks.size(), path_.string());
}

void JsonFileBlockStore::Load() {
  using json = nlohmann::json;

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    LOG_STORE_INFO("Block file {} not found (starting fresh)", path_.string());
    return;
  }

  auto contents = util::read_file_string(path_);
  if (!contents) {
    throw BlockStoreError("cannot read " + path_.string());
  }

  std::vector<Block> loaded;
  try {
    json root = json::parse(*contents);

    int version = root.value("version", 0);
    if (version != STORE_FORMAT_VERSION) {
      throw BlockStoreError("unsupported block file version " +
                            std::to_string(version));
    }
    if (!root.contains("blocks") || !root["blocks"].is_array()) {
      throw BlockStoreError("block file has no 'blocks' array");
    }

    const json &blocks = root["blocks"];
    size_t block_count = root.value("block_count", blocks.size());
    if (block_count != blocks.size()) {
      LOG_STORE_WARN("Block count mismatch: header says {}, array has {}. "
                     "Using actual array size.",
                     block_count, blocks.size());
    }

    loaded.reserve(blocks.size());
    for (const auto &entry : blocks) {
      Block block = Block::FromJson(entry);
      const auto expected = static_cast<int64_t>(loaded.size()) + 1;
      if (block.height != expected) {
        throw BlockStoreError("block file out of order: found height " +
                              std::to_string(block.height) + ", expected " +
                              std::to_string(expected));
      }
      loaded.push_back(std::move(block));
    }
  } catch (const BlockStoreError &) {
    throw;
  } catch (const std::exception &e) {
    LOG_STORE_ERROR("Exception during Load: {}", e.what());
    throw BlockStoreError("corrupt block file " + path_.string() + ": " +
                          e.what());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  blocks_ = std::move(loaded);
  LOG_STORE_INFO("Loaded {} blocks from {}", blocks_.size(), path_.string());
}

} // namespace chain
} // namespace blockledger
