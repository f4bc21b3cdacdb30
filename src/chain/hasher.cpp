// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/hasher.hpp"
#include <array>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <stdexcept>

namespace blockledger {
namespace crypto {

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

Sha256Hasher::Sha256Hasher(const Sha256Hasher &other)
    : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }
  if (EVP_MD_CTX_copy_ex(ctx_, other.ctx_) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
  }
}

Sha256Hasher &Sha256Hasher::operator=(const Sha256Hasher &other) {
  if (this != &other && EVP_MD_CTX_copy_ex(ctx_, other.ctx_) != 1) {
    throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
  }
  return *this;
}

Sha256Hasher::~Sha256Hasher() { EVP_MD_CTX_free(ctx_); }

Sha256Hasher &Sha256Hasher::Write(std::string_view data) {
  if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

uint256 Sha256Hasher::Finalize() {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_, digest.data(), &len) != 1 || len != 32) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  return uint256::FromBigEndian(std::span<const unsigned char>(digest.data(), len));
}

uint256 Sha256(std::string_view data) {
  return Sha256Hasher().Write(data).Finalize();
}

std::string CanonicalSerialize(const nlohmann::json &value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
}

std::string HashJson(const nlohmann::json &value) {
  return Sha256(CanonicalSerialize(value)).GetHex();
}

std::string HashPair(std::string_view left, std::string_view right) {
  return Sha256Hasher().Write(left).Write(right).Finalize().GetHex();
}

} // namespace crypto
} // namespace blockledger
