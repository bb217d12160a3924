// TALLY - Transaction Implementation
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/core/transaction.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace tally {

// ============================================================================
// Transaction Kind
// ============================================================================

const char* TransactionKindToString(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::Deposit:    return "deposit";
        case TransactionKind::Withdrawal: return "withdrawal";
        default:                          return "unknown";
    }
}

std::optional<TransactionKind> ParseTransactionKind(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "deposit") return TransactionKind::Deposit;
    if (lower == "withdrawal") return TransactionKind::Withdrawal;

    return std::nullopt;
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(TransactionKind kind, std::string walletAddress, Amount amount)
    : kind_(kind)
    , walletAddress_(std::move(walletAddress))
    , amount_(amount) {}

Transaction Transaction::Deposit(std::string walletAddress, Amount amount) {
    return Transaction(TransactionKind::Deposit, std::move(walletAddress), amount);
}

Transaction Transaction::Withdrawal(std::string walletAddress, Amount amount) {
    return Transaction(TransactionKind::Withdrawal, std::move(walletAddress), amount);
}

std::string Transaction::ToString() const {
    std::ostringstream oss;
    oss << TransactionKindToString(kind_) << " " << amount_ << " " << walletAddress_;
    return oss.str();
}

} // namespace tally
