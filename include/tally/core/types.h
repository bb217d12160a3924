// TALLY - Core Types Header
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// This file defines fundamental types used throughout TALLY.

#ifndef TALLY_CORE_TYPES_H
#define TALLY_CORE_TYPES_H

#include <cstdint>
#include <limits>

namespace tally {

// ============================================================================
// Basic Types
// ============================================================================

/// Amount in smallest units. Signed: balances may go negative.
using Amount = int64_t;

/// Constants
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();
constexpr Amount MIN_AMOUNT = std::numeric_limits<Amount>::min();

// ============================================================================
// Amount Arithmetic
// ============================================================================

/// Add two amounts, returning false instead of overflowing
inline bool CheckedAdd(Amount a, Amount b, Amount& result) {
    if ((b > 0 && a > MAX_AMOUNT - b) || (b < 0 && a < MIN_AMOUNT - b)) {
        return false;
    }
    result = a + b;
    return true;
}

/// Subtract two amounts, returning false instead of overflowing
inline bool CheckedSub(Amount a, Amount b, Amount& result) {
    if ((b < 0 && a > MAX_AMOUNT + b) || (b > 0 && a < MIN_AMOUNT + b)) {
        return false;
    }
    result = a - b;
    return true;
}

/// Two's complement addition (never undefined)
inline Amount WrappingAdd(Amount a, Amount b) {
    return static_cast<Amount>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}

/// Two's complement subtraction (never undefined)
inline Amount WrappingSub(Amount a, Amount b) {
    return static_cast<Amount>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
}

} // namespace tally

#endif // TALLY_CORE_TYPES_H
