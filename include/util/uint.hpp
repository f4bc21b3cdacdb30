// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

namespace blockledger {

/**
 * 256-bit unsigned value used for digests and proof-of-work targets.
 *
 * Bytes are stored least significant first. GetHex() prints the most
 * significant byte first, so the hex form of a SHA-256 digest stored with
 * FromBigEndian() is the conventional lowercase digest string.
 */
class uint256 {
public:
  static constexpr int WIDTH = 32;

  constexpr uint256() : m_data() {}

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  // Set bit `pos` (0 = least significant); out of range positions are ignored
  void SetBit(unsigned int pos) {
    if (pos >= WIDTH * 8)
      return;
    m_data[pos / 8] |= static_cast<uint8_t>(1u << (pos % 8));
  }

  /** Numeric ordering, most significant byte first. */
  int CompareTo(const uint256 &other) const {
    for (int i = WIDTH - 1; i >= 0; --i) {
      if (m_data[i] < other.m_data[i])
        return -1;
      if (m_data[i] > other.m_data[i])
        return 1;
    }
    return 0;
  }

  friend bool operator==(const uint256 &a, const uint256 &b) {
    return a.m_data == b.m_data;
  }
  friend bool operator!=(const uint256 &a, const uint256 &b) {
    return !(a == b);
  }
  friend bool operator<(const uint256 &a, const uint256 &b) {
    return a.CompareTo(b) < 0;
  }

  std::string GetHex() const;
  std::string ToString() const;

  /** Set from hex string (most significant digit first). Supports "0x". */
  void SetHex(std::string_view str);

  /** Build from a big-endian byte sequence such as a raw SHA-256 digest. */
  static uint256 FromBigEndian(std::span<const unsigned char> bytes);

  constexpr const unsigned char *data() const { return m_data.data(); }
  constexpr unsigned char *data() { return m_data.data(); }

  constexpr unsigned char *begin() { return m_data.data(); }
  constexpr unsigned char *end() { return m_data.data() + WIDTH; }
  constexpr const unsigned char *begin() const { return m_data.data(); }
  constexpr const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }

private:
  std::array<uint8_t, WIDTH> m_data;
};

inline uint256 uint256S(std::string_view str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}

} // namespace blockledger
