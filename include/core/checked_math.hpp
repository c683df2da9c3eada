#pragma once
#include "core/types.hpp"
#include "common/errors.hpp"
#include <limits>

// Unsigned arithmetic that refuses to wrap. Ratio math truncates like integer division.
namespace CheckedMath {
  inline Amount Add(Amount a, Amount b) {
    if (b > std::numeric_limits<Amount>::max() - a) throw LendingError(ErrorCode::AmountOverflow, "addition overflows");
    return a + b;
  }
  inline Amount Sub(Amount a, Amount b) {
    if (b > a) throw LendingError(ErrorCode::AmountOverflow, "subtraction underflows");
    return a - b;
  }
  inline Amount Mul(Amount a, Amount b) {
    if (a != 0 && b > std::numeric_limits<Amount>::max() / a) throw LendingError(ErrorCode::AmountOverflow, "multiplication overflows");
    return a * b;
  }
  // value*100/reference, truncated. reference must be non-zero.
  inline Amount RatioPercent(Amount value, Amount reference) {
    return Mul(value, 100) / reference;
  }
}
