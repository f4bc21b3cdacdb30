// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace blockledger {
namespace chain {

/**
 * Reward - exact block reward amount
 *
 * Stored as mantissa / 2^shift so that repeated halving never rounds.
 * Always normalized: the mantissa is odd whenever shift > 0, so equal values
 * have equal representations.
 *
 * Serialized as a JSON integer when whole (50) and as a JSON number
 * otherwise (12.5); both are exact because every value is a binary fraction.
 */
class Reward {
public:
  constexpr Reward() = default;

  static Reward FromInteger(int64_t coins);

  // Exact decomposition of a finite double; throws std::invalid_argument for
  // NaN, infinities and negative values
  static Reward FromDouble(double value);

  [[nodiscard]] Reward Halved() const;

  [[nodiscard]] double ToDouble() const;
  [[nodiscard]] bool IsZero() const { return mantissa_ == 0; }
  [[nodiscard]] bool IsWhole() const { return shift_ == 0; }
  [[nodiscard]] int64_t Mantissa() const { return mantissa_; }
  [[nodiscard]] unsigned int Shift() const { return shift_; }

  // -1, 0, 1
  [[nodiscard]] int Compare(const Reward &other) const;

  [[nodiscard]] std::string ToString() const;

  friend bool operator==(const Reward &a, const Reward &b) {
    return a.mantissa_ == b.mantissa_ && a.shift_ == b.shift_;
  }
  friend bool operator!=(const Reward &a, const Reward &b) { return !(a == b); }
  friend bool operator<(const Reward &a, const Reward &b) {
    return a.Compare(b) < 0;
  }
  friend bool operator>(const Reward &a, const Reward &b) {
    return a.Compare(b) > 0;
  }

private:
  Reward(int64_t mantissa, unsigned int shift);
  void Normalize();

  int64_t mantissa_{0};
  unsigned int shift_{0};
};

} // namespace chain
} // namespace blockledger
