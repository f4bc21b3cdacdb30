// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace blockledger {
namespace mining {

// Outcome of a nonce search
struct NonceSearchResult {
  enum class Status {
    FOUND,      // nonce satisfies the target
    EXHAUSTED,  // no nonce below max_nonce satisfies the target
    INTERRUPTED // interrupt flag was raised
  };

  Status status{Status::EXHAUSTED};
  uint64_t nonce{0};  // valid only when FOUND
  uint64_t hashes{0}; // attempts made, including the winning one

  bool Found() const { return status == Status::FOUND; }
};

std::string StatusToString(NonceSearchResult::Status status);

// Thrown by the ledger when a search ends without a nonce
class MiningError : public std::runtime_error {
public:
  MiningError(NonceSearchResult::Status status, const std::string &what)
      : std::runtime_error(what), status_(status) {}

  NonceSearchResult::Status GetStatus() const { return status_; }

private:
  NonceSearchResult::Status status_;
};

/**
 * Brute-force nonce search
 *
 * Tries nonce = 0, 1, ... max_nonce - 1 in order and stops at the first one
 * for which SHA-256(candidate || decimal(nonce)) < 2^(256 - difficulty_bits).
 * The result is deterministic for the same candidate bytes and bits.
 *
 * The candidate prefix is hashed once; each attempt only feeds the nonce
 * digits into a copy of that midstate.
 *
 * @param interrupt Optional flag, polled every 4096 attempts. The search runs
 *                  on the calling thread; another thread sets the flag to
 *                  stop it.
 */
NonceSearchResult FindNonce(const std::string &candidate, int difficulty_bits,
                            uint64_t max_nonce,
                            const std::atomic<bool> *interrupt = nullptr);

} // namespace mining
} // namespace blockledger
