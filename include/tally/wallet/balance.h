// TALLY - Wallet Balance Calculation
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Computes the net balance of a wallet from its deposit/withdrawal history.
//
// Two entry points share one fold:
// - CalculateBalance: validates the address, the history and every amount,
//   and reports failures as a typed BalanceError.
// - SumForWallet: relaxed fold with no validation at all. Zero amounts are
//   skipped and overflow wraps.

#ifndef TALLY_WALLET_BALANCE_H
#define TALLY_WALLET_BALANCE_H

#include "tally/core/transaction.h"
#include "tally/core/types.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tally {
namespace wallet {

// ============================================================================
// Balance Errors
// ============================================================================

/// Detail carried by InvalidWalletAddress when the address is empty
constexpr const char* EMPTY_ADDRESS_DETAIL = "Empty address";

/// Address was empty or failed IsValidAddress
struct InvalidWalletAddress {
    /// EMPTY_ADDRESS_DETAIL or the rejected address
    std::string detail;
};

/// The transaction history was empty
struct NoTransactions {
    std::string address;
};

/// A matching transaction had an amount of exactly zero
struct ZeroAmount {};

/// The running balance left the signed 64-bit range
struct BalanceOverflow {
    std::string address;
};

/// Every way CalculateBalance can fail
using BalanceError = std::variant<
    InvalidWalletAddress,
    NoTransactions,
    ZeroAmount,
    BalanceOverflow
>;

/// Human-readable message for an error
std::string BalanceErrorToString(const BalanceError& error);

// ============================================================================
// Balance Result
// ============================================================================

/// Either a balance or the reason it could not be computed
class BalanceResult {
public:
    static BalanceResult Success(Amount balance);
    static BalanceResult Failure(BalanceError error);

    bool IsOk() const { return balance_.has_value(); }
    bool IsError() const { return !balance_.has_value(); }
    explicit operator bool() const { return IsOk(); }

    /// Get the balance (throws std::logic_error on failure)
    Amount GetBalance() const;

    /// Get the balance, or a fallback on failure
    Amount BalanceOr(Amount defaultValue) const {
        return balance_.value_or(defaultValue);
    }

    /// Get the error (throws std::logic_error on success)
    const BalanceError& GetError() const;

    /// Check which error kind this result holds
    template<typename E>
    bool Holds() const {
        return error_.has_value() && std::holds_alternative<E>(*error_);
    }

    /// Convert to string for logging
    std::string ToString() const;

private:
    BalanceResult() = default;

    std::optional<Amount> balance_;
    std::optional<BalanceError> error_;
};

// ============================================================================
// Balance Calculation
// ============================================================================

/**
 * Calculate the balance of a wallet from its transaction history.
 *
 * Checks, in order, stopping at the first failure:
 * 1. walletAddress is non-empty (InvalidWalletAddress{EMPTY_ADDRESS_DETAIL})
 * 2. walletAddress passes IsValidAddress (InvalidWalletAddress{walletAddress})
 * 3. transactions is non-empty, before filtering (NoTransactions)
 *
 * Then folds the transactions whose address equals walletAddress: deposits
 * add, withdrawals subtract. A matching zero amount fails the whole call with
 * ZeroAmount. Except for BalanceOverflow, which is detected on the running
 * sum, the result does not depend on the order of transactions.
 *
 * @param walletAddress Address to compute the balance for
 * @param transactions Full transaction history (any addresses)
 * @return The balance, which may be negative, or the error
 */
BalanceResult CalculateBalance(const std::string& walletAddress,
                               const std::vector<Transaction>& transactions);

/**
 * Sum the transactions of a wallet WITHOUT any validation.
 *
 * Unlike CalculateBalance this never fails: the address is not checked, an
 * empty history yields 0, zero amounts are skipped and overflow wraps.
 */
Amount SumForWallet(const std::string& walletAddress,
                    const std::vector<Transaction>& transactions);

} // namespace wallet
} // namespace tally

#endif // TALLY_WALLET_BALANCE_H
