// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/reward.hpp"
#include <cmath>
#include <limits>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace blockledger {
namespace chain {

Reward::Reward(int64_t mantissa, unsigned int shift)
    : mantissa_(mantissa), shift_(shift) {
  Normalize();
}

void Reward::Normalize() {
  if (mantissa_ == 0) {
    shift_ = 0;
    return;
  }
  while (shift_ > 0 && (mantissa_ & 1) == 0) {
    mantissa_ >>= 1;
    --shift_;
  }
}

Reward Reward::FromInteger(int64_t coins) {
  if (coins < 0) {
    throw std::invalid_argument("reward cannot be negative");
  }
  return Reward(coins, 0);
}

Reward Reward::FromDouble(double value) {
  if (!std::isfinite(value) || value < 0) {
    throw std::invalid_argument("reward must be a finite non-negative number");
  }
  if (value == 0) {
    return Reward();
  }

  // value = frac * 2^exp with frac in [0.5, 1); scale frac to a 53-bit integer
  int exp = 0;
  double frac = std::frexp(value, &exp);
  auto mantissa = static_cast<int64_t>(std::ldexp(frac, 53));
  exp -= 53;

  if (exp >= 0) {
    if (exp >= 63 || mantissa > (std::numeric_limits<int64_t>::max() >> exp)) {
      throw std::invalid_argument("reward out of range");
    }
    return Reward(mantissa << exp, 0);
  }
  return Reward(mantissa, static_cast<unsigned int>(-exp));
}

Reward Reward::Halved() const {
  if (mantissa_ == 0) {
    return *this;
  }
  return Reward(mantissa_, shift_ + 1);
}

double Reward::ToDouble() const {
  return std::ldexp(static_cast<double>(mantissa_), -static_cast<int>(shift_));
}

int Reward::Compare(const Reward &other) const {
  // Bring both to the larger shift. If scaling the smaller-shift mantissa up
  // would overflow, its value is at least 2^63 / 2^shift, which already
  // exceeds the other side.
  auto scaled_less = [](int64_t m, unsigned int d, int64_t other_m) {
    if (m == 0)
      return other_m == 0 ? 0 : -1;
    if (d >= 63 || m > (std::numeric_limits<int64_t>::max() >> d))
      return 1;
    int64_t lhs = m << d;
    return lhs < other_m ? -1 : (lhs > other_m ? 1 : 0);
  };

  if (shift_ <= other.shift_) {
    return scaled_less(mantissa_, other.shift_ - shift_, other.mantissa_);
  }
  return -scaled_less(other.mantissa_, shift_ - other.shift_, mantissa_);
}

std::string Reward::ToString() const {
  if (IsWhole()) {
    return std::to_string(mantissa_);
  }
  return fmt::format("{}", ToDouble());
}

} // namespace chain
} // namespace blockledger
