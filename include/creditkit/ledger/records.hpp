#pragma once

#include <creditkit/common/calendar.hpp>
#include <creditkit/ledger/transaction.hpp>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

namespace creditkit::ledger {

    /// Derived balance projection for one user
    struct CreditBalance {
        std::string user_id;
        dp::i64 total_credits{0};
        dp::i64 lifetime_earned{0};
        dp::i64 lifetime_spent{0};
        dp::i64 transaction_count{0};
        dp::i64 updated_at{0};

        inline void apply(dp::i64 amount, dp::i64 at) {
            total_credits += amount;
            if (amount > 0)
                lifetime_earned += amount;
            else
                lifetime_spent += -amount;
            ++transaction_count;
            if (at > updated_at)
                updated_at = at;
        }

        inline bool sameTotals(const CreditBalance &o) const {
            return total_credits == o.total_credits && lifetime_earned == o.lifetime_earned &&
                   lifetime_spent == o.lifetime_spent && transaction_count == o.transaction_count;
        }
    };

    /// Per-user daily bonus claim state
    struct DailyBonusState {
        std::string user_id;
        CalendarDate last_claim_date;
        dp::i64 current_streak{0};
        CalendarDate next_eligible_date;
        dp::i64 updated_at{0};
    };

    enum class ReservationState : dp::u8 {
        Pending = 0,
        Completed = 1,
    };

    /// Caller-supplied key mapped to at most one resulting transaction
    struct IdempotencyRecord {
        std::string key;
        std::string user_id;
        ReservationState state{ReservationState::Pending};
        std::string resulting_transaction_id;
        dp::i64 created_at{0};
        dp::i64 updated_at{0};
    };

    enum class ReferralType : dp::u8 {
        Signup = 0,
        Purchase = 1,
        Achievement = 2,
    };

    inline std::string referralTypeToString(ReferralType type) {
        switch (type) {
        case ReferralType::Signup:
            return "signup";
        case ReferralType::Purchase:
            return "purchase";
        case ReferralType::Achievement:
            return "achievement";
        default:
            return "unknown";
        }
    }

    inline std::optional<ReferralType> referralTypeFromString(const std::string &name) {
        if (name == "signup")
            return ReferralType::Signup;
        if (name == "purchase")
            return ReferralType::Purchase;
        if (name == "achievement")
            return ReferralType::Achievement;
        return std::nullopt;
    }

    /// One redeemed referral; a referee redeems at most once
    struct ReferralRecord {
        std::string referee_user_id;
        std::string referrer_user_id;
        std::string referral_code;
        ReferralType type{ReferralType::Signup};
        std::string referee_transaction_id;
        std::string referrer_transaction_id;
        dp::i64 created_at{0};

        inline bool isComplete() const { return !referee_transaction_id.empty() && !referrer_transaction_id.empty(); }
    };

    // ===========================================
    // Queries
    // ===========================================

    struct TransactionFilter {
        std::optional<TransactionType> type;
        std::optional<dp::i64> created_from; // inclusive, epoch ms
        std::optional<dp::i64> created_to;   // inclusive, epoch ms
        bool newest_first = true;
    };

    struct PageRequest {
        dp::i64 offset = 0;
        dp::i32 limit = 100;
    };

    struct TransactionPage {
        std::vector<CreditTransaction> transactions;
        dp::i64 total_count{0}; // matching rows across all pages
    };

    /// Fold of a user's ledger
    struct LedgerTotals {
        dp::i64 sum{0};
        dp::i64 earned{0};
        dp::i64 spent{0};
        dp::i64 count{0};
        dp::i64 last_created_at{0};
    };

} // namespace creditkit::ledger
