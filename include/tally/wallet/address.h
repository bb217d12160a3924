// TALLY - Wallet Address Validation
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Lexical validation of base58-style wallet addresses. This is a syntactic
// pre-filter only: no checksum is decoded and no key is recovered.

#ifndef TALLY_WALLET_ADDRESS_H
#define TALLY_WALLET_ADDRESS_H

#include <cstddef>
#include <string>

namespace tally {
namespace wallet {

// ============================================================================
// Address Constants
// ============================================================================

/// Base58 alphabet (no 0, I, O or l)
constexpr const char* ADDRESS_ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

/// Shortest accepted address
constexpr size_t MIN_ADDRESS_LENGTH = 32;

/// Longest accepted address
constexpr size_t MAX_ADDRESS_LENGTH = 44;

// ============================================================================
// Validation
// ============================================================================

/// Check if a character belongs to the address alphabet
bool IsAddressCharacter(char c);

/**
 * Check if a string looks like a wallet address.
 *
 * True iff the length is within [MIN_ADDRESS_LENGTH, MAX_ADDRESS_LENGTH] and
 * every character is in ADDRESS_ALPHABET. Never throws.
 */
bool IsValidAddress(const std::string& address);

} // namespace wallet
} // namespace tally

#endif // TALLY_WALLET_ADDRESS_H
