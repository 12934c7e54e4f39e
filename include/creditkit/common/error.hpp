#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace creditkit {

    // ===========================================
    // Creditkit error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_INVALID_OPERATION = 100;
    constexpr dp::u32 ERR_BALANCE_NOT_FOUND = 101;
    constexpr dp::u32 ERR_DAILY_BONUS_ALREADY_CLAIMED = 102;
    constexpr dp::u32 ERR_INVALID_PURCHASE = 103;
    constexpr dp::u32 ERR_REFERRAL_NOT_VALID = 104;
    constexpr dp::u32 ERR_TRANSACTION_FAILED = 105;
    constexpr dp::u32 ERR_STORAGE_TIMEOUT = 106;
    constexpr dp::u32 ERR_INSUFFICIENT_CREDITS = 107;
    constexpr dp::u32 ERR_DUPLICATE_TRANSACTION = 108;
    constexpr dp::u32 ERR_OPERATION_IN_PROGRESS = 109;
    constexpr dp::u32 ERR_NOT_FOUND = 110;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error invalid_operation(const std::string &msg = "Invalid operation") {
        return dp::Error{ERR_INVALID_OPERATION, dp::String(msg.c_str())};
    }

    inline dp::Error balance_not_found(const std::string &msg = "No ledger history for user") {
        return dp::Error{ERR_BALANCE_NOT_FOUND, dp::String(msg.c_str())};
    }

    inline dp::Error daily_bonus_already_claimed(const std::string &msg = "Daily bonus already claimed today") {
        return dp::Error{ERR_DAILY_BONUS_ALREADY_CLAIMED, dp::String(msg.c_str())};
    }

    inline dp::Error invalid_purchase(const std::string &msg = "Invalid purchase") {
        return dp::Error{ERR_INVALID_PURCHASE, dp::String(msg.c_str())};
    }

    inline dp::Error referral_not_valid(const std::string &msg = "Referral not valid") {
        return dp::Error{ERR_REFERRAL_NOT_VALID, dp::String(msg.c_str())};
    }

    inline dp::Error transaction_failed(const std::string &msg = "Storage transaction failed") {
        return dp::Error{ERR_TRANSACTION_FAILED, dp::String(msg.c_str())};
    }

    inline dp::Error storage_timeout(const std::string &msg = "Storage call timed out") {
        return dp::Error{ERR_STORAGE_TIMEOUT, dp::String(msg.c_str())};
    }

    inline dp::Error insufficient_credits(const std::string &msg = "Insufficient credits") {
        return dp::Error{ERR_INSUFFICIENT_CREDITS, dp::String(msg.c_str())};
    }

    inline dp::Error duplicate_transaction(const std::string &msg = "Duplicate transaction id") {
        return dp::Error{ERR_DUPLICATE_TRANSACTION, dp::String(msg.c_str())};
    }

    inline dp::Error operation_in_progress(const std::string &msg = "Operation already in progress") {
        return dp::Error{ERR_OPERATION_IN_PROGRESS, dp::String(msg.c_str())};
    }

    inline dp::Error not_found(const std::string &msg = "Not found") {
        return dp::Error{ERR_NOT_FOUND, dp::String(msg.c_str())};
    }

    // ===========================================
    // Classification
    // ===========================================

    /// Only storage-layer failures may be retried automatically.
    /// Domain rule violations must reach the caller unchanged.
    inline bool isRetryable(const dp::Error &error) {
        return error.code == ERR_TRANSACTION_FAILED || error.code == ERR_STORAGE_TIMEOUT ||
               error.code == ERR_OPERATION_IN_PROGRESS;
    }

    inline std::string errorName(dp::u32 code) {
        switch (code) {
        case ERR_INVALID_OPERATION:
            return "InvalidOperation";
        case ERR_BALANCE_NOT_FOUND:
            return "BalanceNotFound";
        case ERR_DAILY_BONUS_ALREADY_CLAIMED:
            return "DailyBonusAlreadyClaimed";
        case ERR_INVALID_PURCHASE:
            return "InvalidPurchase";
        case ERR_REFERRAL_NOT_VALID:
            return "ReferralNotValid";
        case ERR_TRANSACTION_FAILED:
            return "TransactionFailed";
        case ERR_STORAGE_TIMEOUT:
            return "StorageTimeout";
        case ERR_INSUFFICIENT_CREDITS:
            return "InsufficientCredits";
        case ERR_DUPLICATE_TRANSACTION:
            return "DuplicateTransaction";
        case ERR_OPERATION_IN_PROGRESS:
            return "OperationInProgress";
        case ERR_NOT_FOUND:
            return "NotFound";
        default:
            return "Unknown";
        }
    }

    inline std::string describe(const dp::Error &error) {
        return errorName(error.code) + ": " + std::string(error.message.c_str());
    }

} // namespace creditkit
