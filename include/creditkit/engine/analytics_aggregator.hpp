#pragma once

#include <creditkit/engine/balance_projector.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace creditkit {

    using namespace creditkit::ledger;

    struct AnalyticsQuery {
        std::string user_id;
        std::optional<dp::i64> created_from; // inclusive, epoch ms
        std::optional<dp::i64> created_to;   // inclusive, epoch ms
        bool include_admin = false;
        dp::i32 page_limit = 500;            // rows per ledger read
        dp::i64 max_transactions = 100000;   // rows folded at most
    };

    /// Earned and spent credits of one UTC calendar month
    struct MonthBucket {
        std::string month; // YYYY-MM
        dp::i64 earned{0};
        dp::i64 spent{0};
    };

    /// Computed on demand, never persisted
    struct AnalyticsSnapshot {
        std::string user_id;
        dp::i64 current_balance{0};
        dp::i64 total_earned{0};
        dp::i64 total_spent{0};
        dp::i64 total_purchases{0};
        dp::i64 daily_bonuses_claimed{0};
        dp::i64 referral_credits{0};
        std::map<std::string, dp::i64> count_by_type;
        std::map<std::string, dp::i64> amount_by_type;
        std::vector<MonthBucket> by_month; // ascending by month
        dp::i64 transactions_examined{0};
        bool truncated{false}; // range held more than max_transactions rows
    };

    /// Read-only folds of a user's ledger into type and month buckets
    class AnalyticsAggregator {
      public:
        AnalyticsAggregator(std::shared_ptr<storage::ILedgerStore> store, std::shared_ptr<BalanceProjector> projector);

        dp::Result<AnalyticsSnapshot, dp::Error> summarize(const AnalyticsQuery &query) const;

      private:
        std::shared_ptr<storage::ILedgerStore> store_;
        std::shared_ptr<BalanceProjector> projector_;
    };

} // namespace creditkit
