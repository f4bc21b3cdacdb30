// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/uint.hpp"

#include <iomanip>
#include <sstream>

namespace blockledger {

static inline int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string uint256::GetHex() const {
  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (int i = WIDTH - 1; i >= 0; --i) {
    ss << std::setw(2) << static_cast<unsigned int>(m_data[i]);
  }
  return ss.str();
}

std::string uint256::ToString() const { return GetHex(); }

void uint256::SetHex(std::string_view str) {
  SetNull();

  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }

  // Only the leading run of hex digits counts
  size_t digits = 0;
  while (digits < str.size() && HexDigit(str[digits]) != -1) {
    ++digits;
  }

  // Walk from the least significant digit towards the front
  size_t byte = 0;
  size_t pos = digits;
  while (pos > 0 && byte < static_cast<size_t>(WIDTH)) {
    uint8_t value = static_cast<uint8_t>(HexDigit(str[--pos]));
    if (pos > 0) {
      value |= static_cast<uint8_t>(HexDigit(str[--pos]) << 4);
    }
    m_data[byte++] = value;
  }
}

uint256 uint256::FromBigEndian(std::span<const unsigned char> bytes) {
  uint256 out;
  size_t n = std::min<size_t>(bytes.size(), WIDTH);
  for (size_t i = 0; i < n; ++i) {
    out.m_data[i] = bytes[bytes.size() - 1 - i];
  }
  return out;
}

} // namespace blockledger
