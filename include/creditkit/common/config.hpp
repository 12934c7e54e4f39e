#pragma once

#include <datapod/datapod.hpp>

namespace creditkit {

    /// Credits granted to each side of a referral
    struct ReferralReward {
        dp::i64 referee_credits = 0;
        dp::i64 referrer_credits = 0;
    };

    /// Engine configuration
    struct EngineConfig {
        // Daily bonus: base + min(streak * step, cap)
        dp::i64 daily_bonus_base = 10;
        dp::i64 daily_bonus_step = 2;
        dp::i64 daily_bonus_cap = 14;

        // Reference timezone for calendar days, as offset from UTC
        dp::i32 reference_utc_offset_minutes = 0;

        // Pending idempotency reservations older than this are retryable
        dp::i64 reservation_timeout_ms = 30000;

        // Bound on waiting for a user's write lock
        dp::i64 user_lock_timeout_ms = 5000;

        // Purchases grant floor(credits * percent / 100) on top
        dp::i64 purchase_bonus_percent = 10;

        // Largest amount accepted for a single operation
        dp::i64 max_operation_amount = 1000000000;

        ReferralReward signup_reward{50, 25};
        ReferralReward purchase_reward{20, 30};
        ReferralReward achievement_reward{15, 15};

        // Analytics reads the ledger in pages of this size
        dp::i32 analytics_page_limit = 500;
        // Hard bound on transactions folded into one snapshot
        dp::i64 analytics_max_transactions = 100000;

        // History page size cap
        dp::i32 history_max_limit = 200;

        bool verbose = false;
    };

} // namespace creditkit
