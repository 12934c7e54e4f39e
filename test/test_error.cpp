#include <doctest/doctest.h>

#include <creditkit/common/error.hpp>

using namespace creditkit;

TEST_SUITE("Error taxonomy") {
    TEST_CASE("Factories carry stable codes") {
        CHECK(invalid_operation().code == ERR_INVALID_OPERATION);
        CHECK(balance_not_found().code == ERR_BALANCE_NOT_FOUND);
        CHECK(daily_bonus_already_claimed().code == ERR_DAILY_BONUS_ALREADY_CLAIMED);
        CHECK(invalid_purchase().code == ERR_INVALID_PURCHASE);
        CHECK(referral_not_valid().code == ERR_REFERRAL_NOT_VALID);
        CHECK(transaction_failed().code == ERR_TRANSACTION_FAILED);
        CHECK(storage_timeout().code == ERR_STORAGE_TIMEOUT);
        CHECK(insufficient_credits().code == ERR_INSUFFICIENT_CREDITS);
        CHECK(duplicate_transaction().code == ERR_DUPLICATE_TRANSACTION);
        CHECK(operation_in_progress().code == ERR_OPERATION_IN_PROGRESS);
        CHECK(not_found().code == ERR_NOT_FOUND);
    }

    TEST_CASE("Only storage failures are retryable") {
        CHECK(isRetryable(transaction_failed()));
        CHECK(isRetryable(storage_timeout()));
        CHECK(isRetryable(operation_in_progress()));

        CHECK_FALSE(isRetryable(invalid_operation()));
        CHECK_FALSE(isRetryable(balance_not_found()));
        CHECK_FALSE(isRetryable(daily_bonus_already_claimed()));
        CHECK_FALSE(isRetryable(invalid_purchase()));
        CHECK_FALSE(isRetryable(referral_not_valid()));
        CHECK_FALSE(isRetryable(insufficient_credits()));
        CHECK_FALSE(isRetryable(duplicate_transaction()));
    }

    TEST_CASE("Names and descriptions") {
        CHECK(errorName(ERR_DAILY_BONUS_ALREADY_CLAIMED) == "DailyBonusAlreadyClaimed");
        CHECK(errorName(ERR_INSUFFICIENT_CREDITS) == "InsufficientCredits");
        CHECK(errorName(9999) == "Unknown");

        auto error = referral_not_valid("Users cannot refer themselves");
        CHECK(describe(error) == "ReferralNotValid: Users cannot refer themselves");
    }
}
