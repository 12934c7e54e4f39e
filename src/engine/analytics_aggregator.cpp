#include <creditkit/engine/analytics_aggregator.hpp>

namespace creditkit {

    AnalyticsAggregator::AnalyticsAggregator(std::shared_ptr<storage::ILedgerStore> store,
                                             std::shared_ptr<BalanceProjector> projector)
        : store_(std::move(store)), projector_(std::move(projector)) {}

    dp::Result<AnalyticsSnapshot, dp::Error> AnalyticsAggregator::summarize(const AnalyticsQuery &query) const {
        using R = dp::Result<AnalyticsSnapshot, dp::Error>;

        if (query.user_id.empty())
            return R::err(invalid_operation("User id is empty"));
        if (query.page_limit <= 0)
            return R::err(invalid_operation("Analytics page limit must be positive"));
        if (query.max_transactions <= 0)
            return R::err(invalid_operation("Analytics transaction bound must be positive"));
        if (query.created_from && query.created_to && *query.created_from > *query.created_to)
            return R::err(invalid_operation("Analytics range start is after its end"));

        AnalyticsSnapshot snapshot;
        snapshot.user_id = query.user_id;

        auto balance = projector_->getBalance(query.user_id);
        if (balance.is_ok()) {
            snapshot.current_balance = balance.value().total_credits;
        } else if (balance.error().code == ERR_BALANCE_NOT_FOUND) {
            return R::ok(snapshot);
        } else {
            return R::err(balance.error());
        }

        TransactionFilter filter;
        filter.created_from = query.created_from;
        filter.created_to = query.created_to;
        filter.newest_first = false;

        PageRequest page;
        page.limit = query.page_limit;

        std::map<std::string, MonthBucket> months;
        dp::i64 total_in_range = 0;

        while (snapshot.transactions_examined < query.max_transactions) {
            dp::i64 remaining = query.max_transactions - snapshot.transactions_examined;
            if (remaining < page.limit)
                page.limit = static_cast<dp::i32>(remaining);

            auto batch = store_->listForUser(query.user_id, filter, page);
            if (!batch.is_ok())
                return R::err(batch.error());
            const auto &rows = batch.value().transactions;
            total_in_range = batch.value().total_count;

            for (const auto &tx : rows) {
                ++snapshot.transactions_examined;
                if (!query.include_admin && isAdminType(tx.type))
                    continue;

                const std::string type = transactionTypeToString(tx.type);
                snapshot.count_by_type[type] += 1;
                snapshot.amount_by_type[type] += tx.amount;

                auto &bucket = months[utcMonthKey(tx.created_at)];
                if (tx.amount > 0) {
                    snapshot.total_earned += tx.amount;
                    bucket.earned += tx.amount;
                } else {
                    snapshot.total_spent += -tx.amount;
                    bucket.spent += -tx.amount;
                }

                if (tx.type == TransactionType::Purchase)
                    ++snapshot.total_purchases;
                else if (tx.type == TransactionType::DailyBonus)
                    ++snapshot.daily_bonuses_claimed;
                else if (tx.type == TransactionType::Referral)
                    snapshot.referral_credits += tx.amount;
            }

            page.offset += static_cast<dp::i64>(rows.size());
            if (rows.empty() || page.offset >= total_in_range)
                break;
        }

        snapshot.truncated = total_in_range > snapshot.transactions_examined;

        for (auto &[key, bucket] : months) {
            bucket.month = key;
            snapshot.by_month.push_back(bucket);
        }
        return R::ok(std::move(snapshot));
    }

} // namespace creditkit
