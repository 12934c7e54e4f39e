#include <doctest/doctest.h>

#include <creditkit/engine/analytics_aggregator.hpp>
#include <creditkit/storage/memory_ledger_store.hpp>

using namespace creditkit;
using namespace creditkit::storage;

namespace {
    struct AnalyticsFixture {
        std::shared_ptr<MemoryLedgerStore> store = std::make_shared<MemoryLedgerStore>();
        std::shared_ptr<BalanceProjector> projector = std::make_shared<BalanceProjector>(store);
        AnalyticsAggregator aggregator{store, projector};

        void post(TransactionType type, dp::i64 amount, dp::i64 at) {
            CreditTransaction tx;
            tx.id = generateTransactionId("alice", at).value();
            tx.user_id = "alice";
            tx.type = type;
            tx.amount = amount;
            tx.created_at = at;
            tx.digest = computeTransactionDigest(tx).value();

            auto uow = store->begin();
            REQUIRE(uow.is_ok());
            REQUIRE(store->append(tx).is_ok());
            REQUIRE(projector->applyDelta("alice", amount, at).is_ok());
            REQUIRE(uow.value()->commit().is_ok());
        }
    };

    dp::i64 at(dp::i32 y, dp::u32 m, dp::u32 d) { return CalendarDate::fromYmd(y, m, d).startMillis() + 3600 * 1000; }
} // namespace

TEST_SUITE("AnalyticsAggregator") {
    TEST_CASE("Type and month breakdown") {
        AnalyticsFixture f;
        f.post(TransactionType::Grant, 50, at(2024, 1, 5));
        f.post(TransactionType::DailyBonus, 10, at(2024, 1, 6));
        f.post(TransactionType::Purchase, 44, at(2024, 2, 1));
        f.post(TransactionType::Spend, -30, at(2024, 2, 2));
        f.post(TransactionType::Referral, 50, at(2024, 2, 3));
        f.post(TransactionType::AdminAdd, 100, at(2024, 2, 4));
        f.post(TransactionType::AdminDeduct, -5, at(2024, 3, 1));

        AnalyticsQuery query;
        query.user_id = "alice";
        auto snapshot = f.aggregator.summarize(query);
        REQUIRE(snapshot.is_ok());
        const auto &s = snapshot.value();

        CHECK(s.current_balance == 219);
        CHECK(s.total_earned == 154);
        CHECK(s.total_spent == 30);
        CHECK(s.total_purchases == 1);
        CHECK(s.daily_bonuses_claimed == 1);
        CHECK(s.referral_credits == 50);
        CHECK(s.count_by_type.count("admin_add") == 0);
        CHECK(s.count_by_type.at("spend") == 1);
        CHECK(s.amount_by_type.at("purchase") == 44);
        CHECK(s.transactions_examined == 7);
        CHECK_FALSE(s.truncated);

        REQUIRE(s.by_month.size() == 2);
        CHECK(s.by_month[0].month == "2024-01");
        CHECK(s.by_month[0].earned == 60);
        CHECK(s.by_month[1].month == "2024-02");
        CHECK(s.by_month[1].earned == 94);
        CHECK(s.by_month[1].spent == 30);

        SUBCASE("Admin rows on request") {
            query.include_admin = true;
            auto with_admin = f.aggregator.summarize(query).value();
            CHECK(with_admin.total_earned == 254);
            CHECK(with_admin.total_spent == 35);
            CHECK(with_admin.by_month.size() == 3);
            CHECK(with_admin.count_by_type.at("admin_deduct") == 1);
        }

        SUBCASE("Date range") {
            query.created_from = CalendarDate::fromYmd(2024, 2, 1).startMillis();
            query.created_to = CalendarDate::fromYmd(2024, 2, 3).startMillis() + MILLIS_PER_DAY - 1;
            auto february = f.aggregator.summarize(query).value();
            CHECK(february.total_earned == 94);
            CHECK(february.by_month.size() == 1);
            CHECK(february.current_balance == 219);
        }

        SUBCASE("Small pages give the same answer") {
            query.page_limit = 2;
            auto paged = f.aggregator.summarize(query).value();
            CHECK(paged.total_earned == s.total_earned);
            CHECK(paged.transactions_examined == 7);
        }

        SUBCASE("Bounded reads report truncation") {
            query.page_limit = 2;
            query.max_transactions = 3;
            auto bounded = f.aggregator.summarize(query).value();
            CHECK(bounded.truncated);
            CHECK(bounded.transactions_examined == 3);
            CHECK(bounded.total_earned == 104);
            CHECK(bounded.total_purchases == 1);
        }
    }

    TEST_CASE("User without history gets an empty snapshot") {
        AnalyticsFixture f;
        AnalyticsQuery query;
        query.user_id = "nobody";
        auto snapshot = f.aggregator.summarize(query);
        REQUIRE(snapshot.is_ok());
        CHECK(snapshot.value().current_balance == 0);
        CHECK(snapshot.value().by_month.empty());
    }

    TEST_CASE("Invalid queries") {
        AnalyticsFixture f;
        AnalyticsQuery query;
        CHECK(f.aggregator.summarize(query).error().code == ERR_INVALID_OPERATION);

        query.user_id = "alice";
        query.page_limit = 0;
        CHECK(f.aggregator.summarize(query).error().code == ERR_INVALID_OPERATION);

        query.page_limit = 10;
        query.created_from = 100;
        query.created_to = 50;
        CHECK(f.aggregator.summarize(query).error().code == ERR_INVALID_OPERATION);
    }
}
