// TALLY - Wallet Balance Calculation Implementation
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/wallet/balance.h"
#include "tally/wallet/address.h"
#include "tally/util/logging.h"

#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace tally {
namespace wallet {

// ============================================================================
// Balance Errors
// ============================================================================

std::string BalanceErrorToString(const BalanceError& error) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, InvalidWalletAddress>) {
            return "Invalid wallet address: " + e.detail;
        } else if constexpr (std::is_same_v<T, NoTransactions>) {
            return "No transactions found for wallet " + e.address;
        } else if constexpr (std::is_same_v<T, ZeroAmount>) {
            return "Amount cannot be zero";
        } else {
            return "Balance overflow for wallet " + e.address;
        }
    }, error);
}

// ============================================================================
// Balance Result
// ============================================================================

BalanceResult BalanceResult::Success(Amount balance) {
    BalanceResult result;
    result.balance_ = balance;
    return result;
}

BalanceResult BalanceResult::Failure(BalanceError error) {
    BalanceResult result;
    result.error_ = std::move(error);
    return result;
}

Amount BalanceResult::GetBalance() const {
    if (!balance_) {
        throw std::logic_error("Attempting to read balance of failed result: " +
                               BalanceErrorToString(*error_));
    }
    return *balance_;
}

const BalanceError& BalanceResult::GetError() const {
    if (!error_) {
        throw std::logic_error("Attempting to read error of successful result");
    }
    return *error_;
}

std::string BalanceResult::ToString() const {
    std::ostringstream oss;
    if (balance_) {
        oss << "BalanceResult(ok, " << *balance_ << ")";
    } else {
        oss << "BalanceResult(error, " << BalanceErrorToString(*error_) << ")";
    }
    return oss.str();
}

// ============================================================================
// Fold
// ============================================================================

namespace {

/// How the fold treats records the strict calculation rejects
enum class FoldMode {
    Strict,   ///< Zero amount and overflow fail the fold
    Relaxed   ///< Zero amount is skipped, overflow wraps
};

BalanceResult FoldTransactions(const std::string& walletAddress,
                               const std::vector<Transaction>& transactions,
                               FoldMode mode) {
    Amount balance = 0;
    size_t matched = 0;

    for (const auto& tx : transactions) {
        if (!tx.IsFor(walletAddress)) {
            continue;
        }
        ++matched;

        if (tx.GetAmount() == 0) {
            if (mode == FoldMode::Strict) {
                LOG_DEBUG(util::LogCategory::WALLET)
                    << "Zero amount in " << tx.ToString();
                return BalanceResult::Failure(ZeroAmount{});
            }
            continue;
        }

        if (mode == FoldMode::Relaxed) {
            balance = tx.IsDeposit() ? WrappingAdd(balance, tx.GetAmount())
                                     : WrappingSub(balance, tx.GetAmount());
            continue;
        }

        bool ok = tx.IsDeposit() ? CheckedAdd(balance, tx.GetAmount(), balance)
                                 : CheckedSub(balance, tx.GetAmount(), balance);
        if (!ok) {
            LOG_WARN(util::LogCategory::WALLET)
                << "Balance overflow for " << walletAddress
                << " at " << tx.ToString();
            return BalanceResult::Failure(BalanceOverflow{walletAddress});
        }
    }

    LOG_DEBUG(util::LogCategory::WALLET)
        << "Folded " << matched << "/" << transactions.size()
        << " transactions for " << walletAddress << ": " << balance;
    return BalanceResult::Success(balance);
}

} // namespace

// ============================================================================
// Balance Calculation
// ============================================================================

BalanceResult CalculateBalance(const std::string& walletAddress,
                               const std::vector<Transaction>& transactions) {
    if (walletAddress.empty()) {
        LOG_DEBUG(util::LogCategory::WALLET) << "Rejecting empty wallet address";
        return BalanceResult::Failure(InvalidWalletAddress{EMPTY_ADDRESS_DETAIL});
    }

    if (!IsValidAddress(walletAddress)) {
        LOG_DEBUG(util::LogCategory::WALLET)
            << "Rejecting malformed wallet address: " << walletAddress;
        return BalanceResult::Failure(InvalidWalletAddress{walletAddress});
    }

    if (transactions.empty()) {
        LOG_DEBUG(util::LogCategory::WALLET)
            << "No transaction history for " << walletAddress;
        return BalanceResult::Failure(NoTransactions{walletAddress});
    }

    return FoldTransactions(walletAddress, transactions, FoldMode::Strict);
}

Amount SumForWallet(const std::string& walletAddress,
                    const std::vector<Transaction>& transactions) {
    return FoldTransactions(walletAddress, transactions, FoldMode::Relaxed).GetBalance();
}

} // namespace wallet
} // namespace tally
