/**
 * Example: credit ledger on SQLite
 *
 * Walks one user through a welcome grant, two daily bonuses, a store
 * purchase (delivered twice), a referral and a spend, then prints the
 * history, analytics and a reconciliation report.
 */

#include <creditkit.hpp>
#include <filesystem>
#include <iostream>

using namespace creditkit;
using namespace creditkit::storage;

static void printBalance(const char *label, const dp::Result<CreditBalance, dp::Error> &balance) {
    if (balance.is_ok())
        std::cout << label << ": " << balance.value().total_credits << " credits" << std::endl;
    else
        std::cout << label << ": " << describe(balance.error()) << std::endl;
}

int main(int argc, char **argv) {
    const std::string path = argc > 1 ? argv[1] : "creditkit_demo.db";
    std::filesystem::remove(path);

    auto store = std::make_shared<SqliteLedgerStore>();
    auto opened = store->open(path);
    if (!opened.is_ok()) {
        std::cerr << "Failed to open " << path << ": " << opened.error().message.c_str() << std::endl;
        return 1;
    }
    auto schema = store->initializeSchema();
    if (!schema.is_ok()) {
        std::cerr << "Failed to create schema: " << schema.error().message.c_str() << std::endl;
        return 1;
    }

    // 2024-03-10 09:00 UTC
    auto clock = std::make_shared<ManualClock>(CalendarDate::fromYmd(2024, 3, 10).startMillis() + 9 * 3600 * 1000LL);
    EngineConfig config;
    auto engine = Orchestrator::create(store, clock, config);

    std::cout << "=== Credit ledger demo ===" << std::endl;
    printBalance("New user", engine->getBalance("alice"));

    printBalance("Welcome grant", engine->addCredits("alice", 50, "welcome"));

    auto day1 = engine->claimDailyBonus("alice");
    if (day1.is_ok())
        std::cout << "Day 1 bonus: +" << day1.value().amount << " (streak " << day1.value().new_streak << ")"
                  << std::endl;

    auto again = engine->claimDailyBonus("alice");
    if (!again.is_ok())
        std::cout << "Second claim today: " << errorName(again.error().code) << std::endl;

    clock->advanceDays(1);
    auto day2 = engine->claimDailyBonus("alice");
    if (day2.is_ok())
        std::cout << "Day 2 bonus: +" << day2.value().amount << " (streak " << day2.value().new_streak << ")"
                  << std::endl;

    std::cout << "\nProducts on ios:" << std::endl;
    for (const auto &product : engine->getAvailableProducts(Platform::IOS))
        std::cout << "  " << product.id << " " << product.packCredits() << " credits" << std::endl;

    PurchaseRequest purchase;
    purchase.user_id = "alice";
    purchase.product_id = "credits_popular_ios";
    purchase.purchase_token = "receipt-7f3a";
    purchase.platform = Platform::IOS;
    purchase.transaction_id = "1000000012345";

    for (int delivery = 1; delivery <= 2; ++delivery) {
        auto result = engine->processPurchase(purchase);
        if (result.is_ok())
            std::cout << "Purchase delivery " << delivery << ": " << result.value().credits_granted << " + "
                      << result.value().bonus_credits << " bonus, tx " << result.value().transaction.id << std::endl;
        else
            std::cout << "Purchase delivery " << delivery << " failed: " << describe(result.error()) << std::endl;
    }

    ReferralRequest referral;
    referral.referrer_user_id = "alice";
    referral.referee_user_id = "bob";
    referral.referral_code = "ALICE-2024";
    referral.type = ReferralType::Signup;
    auto referred = engine->processReferral(referral);
    if (referred.is_ok())
        std::cout << "Referral: alice +" << referred.value().referrer_credits << ", bob +"
                  << referred.value().referee_credits << std::endl;

    auto spent = engine->deductCredits("alice", 30, "avatar pack");
    printBalance("After spend", spent);

    auto overdraft = engine->deductCredits("bob", 1000, "too much");
    if (!overdraft.is_ok())
        std::cout << "Overdraft attempt: " << errorName(overdraft.error().code) << std::endl;

    HistoryQuery history_query;
    history_query.user_id = "alice";
    auto history = engine->getUserTransactions(history_query);
    if (history.is_ok()) {
        std::cout << "\nHistory (" << history.value().total_count << " transactions)" << std::endl;
        for (const auto &day : history.value().by_day) {
            std::cout << "  " << day.date.toString() << " net " << day.net_amount << std::endl;
            for (const auto &tx : day.transactions)
                std::cout << "    " << transactionTypeToString(tx.type) << " " << tx.amount << " " << tx.description
                          << std::endl;
        }
    }

    auto analytics = engine->getCreditAnalytics("alice");
    if (analytics.is_ok()) {
        const auto &a = analytics.value();
        std::cout << "\nAnalytics: balance " << a.current_balance << ", earned " << a.total_earned << ", spent "
                  << a.total_spent << ", purchases " << a.total_purchases << ", bonuses " << a.daily_bonuses_claimed
                  << ", referral credits " << a.referral_credits << std::endl;
        for (const auto &month : a.by_month)
            std::cout << "  " << month.month << " +" << month.earned << " -" << month.spent << std::endl;
    }

    auto summary = engine->reconcileAll();
    if (summary.is_ok())
        std::cout << "\nReconciliation: " << summary.value().reports.size() << " users, "
                  << (summary.value().consistent() ? "consistent" : "DRIFT") << std::endl;

    store->close();
    std::filesystem::remove(path);
    return 0;
}
