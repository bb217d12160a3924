// TALLY - Transaction Header
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// This file defines the deposit/withdrawal transaction record.

#ifndef TALLY_CORE_TRANSACTION_H
#define TALLY_CORE_TRANSACTION_H

#include "tally/core/types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace tally {

// ============================================================================
// Transaction Kind
// ============================================================================

/// Direction of a transaction relative to its wallet
enum class TransactionKind : uint8_t {
    Deposit = 0,     ///< Adds funds to the wallet
    Withdrawal = 1   ///< Removes funds from the wallet
};

/// Convert kind to string ("deposit" / "withdrawal")
const char* TransactionKindToString(TransactionKind kind);

/// Parse kind from string (case-insensitive)
std::optional<TransactionKind> ParseTransactionKind(const std::string& str);

// ============================================================================
// Transaction
// ============================================================================

/// A single historical deposit or withdrawal. Immutable once constructed.
class Transaction {
public:
    Transaction(TransactionKind kind, std::string walletAddress, Amount amount);

    /// Convenience constructors
    static Transaction Deposit(std::string walletAddress, Amount amount);
    static Transaction Withdrawal(std::string walletAddress, Amount amount);

    TransactionKind GetKind() const { return kind_; }
    const std::string& GetWalletAddress() const { return walletAddress_; }
    Amount GetAmount() const { return amount_; }

    bool IsDeposit() const { return kind_ == TransactionKind::Deposit; }
    bool IsWithdrawal() const { return kind_ == TransactionKind::Withdrawal; }

    /// Check if this transaction belongs to the given wallet
    bool IsFor(const std::string& walletAddress) const {
        return walletAddress_ == walletAddress;
    }

    /// "<kind> <amount> <address>"
    std::string ToString() const;

    friend bool operator==(const Transaction& a, const Transaction& b) {
        return a.kind_ == b.kind_ && a.amount_ == b.amount_ &&
               a.walletAddress_ == b.walletAddress_;
    }

    friend bool operator!=(const Transaction& a, const Transaction& b) {
        return !(a == b);
    }

private:
    TransactionKind kind_;
    std::string walletAddress_;
    Amount amount_;
};

} // namespace tally

#endif // TALLY_CORE_TRANSACTION_H
