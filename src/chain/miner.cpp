// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/miner.hpp"
#include "chain/hasher.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"
#include <charconv>
#include <string_view>

namespace blockledger {
namespace mining {

namespace {

// Interrupt polling period (attempts)
constexpr uint64_t INTERRUPT_CHECK_INTERVAL = 4096;

} // namespace

std::string StatusToString(NonceSearchResult::Status status) {
  switch (status) {
  case NonceSearchResult::Status::FOUND:
    return "found";
  case NonceSearchResult::Status::EXHAUSTED:
    return "exhausted";
  case NonceSearchResult::Status::INTERRUPTED:
    return "interrupted";
  }
  return "unknown";
}

NonceSearchResult FindNonce(const std::string &candidate, int difficulty_bits,
                            uint64_t max_nonce,
                            const std::atomic<bool> *interrupt) {
  NonceSearchResult result;

  LOG_CHAIN_TRACE("Miner: searching nonce (bits: {}, max_nonce: {})",
                  difficulty_bits, max_nonce);

  crypto::Sha256Hasher midstate;
  midstate.Write(candidate);
  crypto::Sha256Hasher attempt(midstate);

  char digits[24];
  for (uint64_t nonce = 0; nonce < max_nonce; ++nonce) {
    if (interrupt && nonce % INTERRUPT_CHECK_INTERVAL == 0 &&
        interrupt->load(std::memory_order_relaxed)) {
      LOG_CHAIN_TRACE("Miner: interrupted after {} hashes", result.hashes);
      result.status = NonceSearchResult::Status::INTERRUPTED;
      return result;
    }

    auto [end, ec] = std::to_chars(digits, digits + sizeof(digits), nonce);
    (void)ec; // 20 digits always fit

    attempt = midstate;
    attempt.Write(std::string_view(digits, static_cast<size_t>(end - digits)));
    ++result.hashes;

    if (consensus::CheckProofOfWork(attempt.Finalize(), difficulty_bits)) {
      LOG_CHAIN_TRACE("Miner: nonce {} found after {} hashes", nonce,
                      result.hashes);
      result.status = NonceSearchResult::Status::FOUND;
      result.nonce = nonce;
      return result;
    }
  }

  LOG_CHAIN_TRACE("Miner: nonce space exhausted ({} hashes)", result.hashes);
  result.status = NonceSearchResult::Status::EXHAUSTED;
  return result;
}

} // namespace mining
} // namespace blockledger
