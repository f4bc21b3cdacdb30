// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>

// OpenSSL context type (kept out of the header)
struct evp_md_ctx_st;

namespace blockledger {
namespace crypto {

/**
 * Incremental SHA-256 (OpenSSL EVP)
 *
 * Usage mirrors the classic CSHA256 shape:
 *   uint256 h = Sha256Hasher().Write("abc").Finalize();
 *
 * Copying a hasher duplicates its midstate, which lets the nonce search hash
 * a long candidate prefix once and only feed the nonce digits per attempt.
 * Throws std::runtime_error if OpenSSL fails.
 */
class Sha256Hasher {
public:
  Sha256Hasher();
  Sha256Hasher(const Sha256Hasher &other);
  Sha256Hasher &operator=(const Sha256Hasher &other);
  ~Sha256Hasher();

  Sha256Hasher &Write(std::string_view data);

  // The hasher must not be written to after Finalize()
  uint256 Finalize();

private:
  evp_md_ctx_st *ctx_;
};

// SHA-256 of raw bytes; GetHex() gives the conventional digest string
uint256 Sha256(std::string_view data);

/**
 * Canonical serialization: compact JSON with object keys sorted by byte
 * value at every level (nlohmann::json objects are ordered maps).
 * Throws nlohmann::json::type_error on invalid UTF-8 strings.
 */
std::string CanonicalSerialize(const nlohmann::json &value);

// Lowercase hex SHA-256 of the canonical serialization
std::string HashJson(const nlohmann::json &value);

// Hex SHA-256 of the two hex strings concatenated; HashPair(a, b) !=
// HashPair(b, a)
std::string HashPair(std::string_view left, std::string_view right);

} // namespace crypto
} // namespace blockledger
