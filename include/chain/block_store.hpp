// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace blockledger {
namespace chain {

// Store unavailable (I/O failure, corrupt file) or insert rejected
class BlockStoreError : public std::runtime_error {
public:
  explicit BlockStoreError(const std::string &what)
      : std::runtime_error(what) {}
};

// Numeric block fields a store can rank by
enum class BlockField {
  DIFFICULTY,
  ELAPSED_TIME,
  BLOCK_REWARD,
  HASH_POWER,
  HEIGHT,
  NONCE,
  NUMBER_OF_TRANSACTIONS
};

// JSON field name -> BlockField; nullopt for any other name
std::optional<BlockField> ParseBlockField(std::string_view name);

// -1, 0, 1 ordering of two blocks by one field
int CompareBlocksByField(const Block &a, const Block &b, BlockField field);

/**
 * BlockStore - append-only, height-ordered block log
 *
 * Heights are dense: the block at position i has height i + 1, and Insert
 * only accepts height Count() + 1. Implementations serialize their own
 * inserts, so the height check and the append are atomic.
 */
class BlockStore {
public:
  virtual ~BlockStore() = default;

  // Throws BlockStoreError on a height other than Count() + 1 or on I/O
  // failure; the store is unchanged in both cases
  virtual void Insert(const Block &block) = 0;

  virtual int64_t Count() const = 0;

  // nullopt outside [1, Count()]
  virtual std::optional<Block> FindByHeight(int64_t height) const = 0;

  // Up to n blocks sorted descending by field; ties keep ascending height
  virtual std::vector<Block> FindTopN(BlockField field, size_t n) const = 0;

  // Same, by JSON field name; empty for unknown names
  std::vector<Block> FindTopN(std::string_view field, size_t n) const;

  // Latest n blocks, newest first
  std::vector<Block> FindLastN(size_t n) const {
    return FindTopN(BlockField::HEIGHT, n);
  }

  std::optional<Block> GetLast() const { return FindByHeight(Count()); }

  // Remove every block
  virtual void DropAll() = 0;
};

/**
 * MemoryBlockStore - blocks held in a vector
 *
 * Subclasses add durability by overriding Persist(), which runs under the
 * store lock after each change. If it throws, the change is rolled back and
 * the exception propagates.
 */
class MemoryBlockStore : public BlockStore {
public:
  MemoryBlockStore() = default;

  void Insert(const Block &block) override;
  int64_t Count() const override;
  std::optional<Block> FindByHeight(int64_t height) const override;
  using BlockStore::FindTopN;
  std::vector<Block> FindTopN(BlockField field, size_t n) const override;
  void DropAll() override;

protected:
  virtual void Persist(const std::vector<Block> & /*blocks*/) {}

  mutable std::mutex mutex_;
  std::vector<Block> blocks_;
};

/**
 * JsonFileBlockStore - whole chain in one JSON document
 *
 * Format:
 *   {"version": 1, "block_count": N, "blocks": [<block>, ...]}
 * Every change rewrites the file atomically (tmp + fsync + rename).
 * The constructor loads an existing file and throws BlockStoreError if it is
 * unreadable or corrupt; a missing file starts an empty chain.
 */
class JsonFileBlockStore : public MemoryBlockStore {
public:
  explicit JsonFileBlockStore(std::filesystem::path path);

  const std::filesystem::path &GetPath() const { return path_; }

protected:
  void Persist(const std::vector<Block> &blocks) override;

private:
  void Load();

  std::filesystem::path path_;
};

} // namespace chain
} // namespace blockledger
