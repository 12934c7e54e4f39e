#pragma once

#include <creditkit/common/config.hpp>
#include <creditkit/engine/analytics_aggregator.hpp>
#include <creditkit/engine/balance_projector.hpp>
#include <creditkit/engine/idempotency_guard.hpp>
#include <creditkit/engine/product_catalog.hpp>
#include <creditkit/engine/streak_tracker.hpp>
#include <creditkit/engine/user_lock_table.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace creditkit {

    using namespace creditkit::ledger;

    // ===========================================
    // Requests and results
    // ===========================================

    struct PurchaseRequest {
        std::string user_id;
        std::string product_id;
        std::string purchase_token;
        Platform platform{Platform::IOS};
        std::string transaction_id; // store transaction id; falls back to the token when empty
    };

    struct PurchaseResult {
        dp::i64 credits_granted{0};
        dp::i64 bonus_credits{0};
        CreditTransaction transaction;
    };

    struct DailyBonusClaim {
        CreditTransaction transaction;
        dp::i64 amount{0};
        dp::i64 new_streak{0};
        CalendarDate date;
        CreditBalance balance;
    };

    struct ReferralRequest {
        std::string referrer_user_id;
        std::string referee_user_id;
        std::string referral_code;
        ReferralType type{ReferralType::Signup};
        Metadata metadata;
    };

    struct ReferralResult {
        dp::i64 referrer_credits{0};
        dp::i64 referee_credits{0};
        std::string referrer_transaction_id;
        std::string referee_transaction_id;
    };

    struct HistoryQuery {
        std::string user_id;
        std::optional<TransactionType> type;
        std::optional<dp::i64> created_from; // inclusive, epoch ms
        std::optional<dp::i64> created_to;   // inclusive, epoch ms
        dp::i64 page = 1;                    // 1-based
        dp::i32 limit = 20;
        bool newest_first = true;
    };

    /// Transactions of one calendar day (reference timezone)
    struct DayGroup {
        CalendarDate date;
        std::vector<CreditTransaction> transactions;
        dp::i64 net_amount{0};
    };

    struct TransactionHistory {
        std::vector<CreditTransaction> transactions;
        std::vector<DayGroup> by_day; // same order as transactions
        dp::i64 total_count{0};
        dp::i64 current_page{1};
        dp::i64 total_pages{0};
        bool has_more{false};
    };

    struct ReconciliationSummary {
        std::vector<ReconciliationReport> reports;
        std::vector<ReferralRecord> incomplete_referrals;

        inline bool consistent() const {
            if (!incomplete_referrals.empty())
                return false;
            for (const auto &r : reports) {
                if (!r.consistent())
                    return false;
            }
            return true;
        }
    };

    // ===========================================
    // Orchestrator - single entry point of the engine
    // ===========================================

    /// Every write: validate, lock the user, open a unit of work, resolve
    /// idempotency, append, update derived state, commit. Nothing is visible
    /// unless all of it committed.
    class Orchestrator {
      public:
        Orchestrator(std::shared_ptr<storage::ILedgerStore> store, std::shared_ptr<IdempotencyGuard> guard,
                     std::shared_ptr<StreakTracker> streaks, std::shared_ptr<BalanceProjector> projector,
                     std::shared_ptr<AnalyticsAggregator> analytics, std::shared_ptr<const ProductCatalog> catalog,
                     std::shared_ptr<IReceiptVerifier> verifier, std::shared_ptr<const IClock> clock,
                     EngineConfig config = EngineConfig{});

        /// Wire the default collaborators around a store
        static std::unique_ptr<Orchestrator> create(std::shared_ptr<storage::ILedgerStore> store,
                                                    std::shared_ptr<const IClock> clock,
                                                    EngineConfig config = EngineConfig{},
                                                    ProductCatalog catalog = ProductCatalog::defaultCatalog());

        Orchestrator(const Orchestrator &) = delete;
        Orchestrator &operator=(const Orchestrator &) = delete;

        // ===========================================
        // Balance
        // ===========================================

        dp::Result<CreditBalance, dp::Error> getBalance(const std::string &user_id);
        dp::Result<CreditBalance, dp::Error> addCredits(const std::string &user_id, dp::i64 amount,
                                                        const std::string &description);
        dp::Result<CreditBalance, dp::Error> deductCredits(const std::string &user_id, dp::i64 amount,
                                                           const std::string &description);

        // ===========================================
        // Purchases
        // ===========================================

        dp::Result<PurchaseResult, dp::Error> processPurchase(const PurchaseRequest &request);
        std::vector<CreditProduct> getAvailableProducts(Platform platform) const;

        // ===========================================
        // Daily bonus
        // ===========================================

        dp::Result<DailyBonusStatus, dp::Error> getDailyBonusStatus(const std::string &user_id);
        dp::Result<DailyBonusClaim, dp::Error> claimDailyBonus(const std::string &user_id);

        // ===========================================
        // Referrals
        // ===========================================

        dp::Result<ReferralResult, dp::Error> processReferral(const ReferralRequest &request);

        // ===========================================
        // Reads
        // ===========================================

        dp::Result<TransactionHistory, dp::Error> getUserTransactions(const HistoryQuery &query);
        dp::Result<AnalyticsSnapshot, dp::Error> getCreditAnalytics(AnalyticsQuery query);
        dp::Result<AnalyticsSnapshot, dp::Error> getCreditAnalytics(const std::string &user_id,
                                                                    std::optional<dp::i64> created_from = std::nullopt,
                                                                    std::optional<dp::i64> created_to = std::nullopt,
                                                                    bool include_admin = false);

        // ===========================================
        // Administration
        // ===========================================

        dp::Result<CreditTransaction, dp::Error> adminAddCredits(const std::string &user_id, dp::i64 amount,
                                                                 const std::string &reason,
                                                                 const std::string &admin_id);
        dp::Result<CreditTransaction, dp::Error> adminDeductCredits(const std::string &user_id, dp::i64 amount,
                                                                    const std::string &reason,
                                                                    const std::string &admin_id);

        /// Fold one user's ledger, report drift and digest failures, optionally rebuild the cache
        dp::Result<ReconciliationReport, dp::Error> reconcileUser(const std::string &user_id, bool repair = false);

        /// Reconcile every user and audit referral records
        dp::Result<ReconciliationSummary, dp::Error> reconcileAll(bool repair = false);

        inline const EngineConfig &config() const { return config_; }

      private:
        struct Written {
            CreditTransaction transaction;
            CreditBalance balance;
        };

        dp::Result<void, dp::Error> validateUser(const std::string &user_id) const;
        dp::Result<void, dp::Error> validateAmount(dp::i64 amount) const;
        dp::Result<UserLockTable::Guard, dp::Error> lockUsers(std::vector<std::string> user_ids);

        /// Build, digest, append and project one transaction
        dp::Result<Written, dp::Error> write(const std::string &user_id, TransactionType type, dp::i64 amount,
                                             const std::string &description, const Metadata &metadata,
                                             const std::optional<std::string> &idempotency_key);

        dp::Result<Written, dp::Error> credit(const std::string &user_id, TransactionType type, dp::i64 amount,
                                              const std::string &description, const Metadata &metadata);
        dp::Result<Written, dp::Error> debit(const std::string &user_id, TransactionType type, dp::i64 amount,
                                             const std::string &description, const Metadata &metadata);

        /// Rebuild the result of an already credited purchase from its ledger row
        dp::Result<PurchaseResult, dp::Error> replayPurchase(const std::string &transaction_id);

        dp::Result<std::string, dp::Error> referralSide(const std::string &key, const std::string &user_id,
                                                        dp::i64 amount, const ReferralRequest &request,
                                                        const std::string &role);

        /// Run `fn` in a unit of work and commit when it succeeds
        template <typename T, typename Fn> dp::Result<T, dp::Error> inUnitOfWork(const char *op, Fn &&fn) {
            auto uow = store_->begin();
            if (!uow.is_ok())
                return failed<T>(op, uow.error());
            auto result = fn();
            if (!result.is_ok()) {
                uow.value()->rollback();
                return failed<T>(op, result.error());
            }
            auto committed = uow.value()->commit();
            if (!committed.is_ok())
                return failed<T>(op, committed.error());
            return result;
        }

        template <typename T> dp::Result<T, dp::Error> failed(const char *op, const dp::Error &error) const {
            if (isRetryable(error))
                std::cerr << "[orchestrator] " << op << " failed: " << describe(error) << std::endl;
            else if (config_.verbose)
                std::cout << "[orchestrator] " << op << " rejected: " << describe(error) << std::endl;
            return dp::Result<T, dp::Error>::err(error);
        }

        std::shared_ptr<storage::ILedgerStore> store_;
        std::shared_ptr<IdempotencyGuard> guard_;
        std::shared_ptr<StreakTracker> streaks_;
        std::shared_ptr<BalanceProjector> projector_;
        std::shared_ptr<AnalyticsAggregator> analytics_;
        std::shared_ptr<const ProductCatalog> catalog_;
        std::shared_ptr<IReceiptVerifier> verifier_;
        std::shared_ptr<const IClock> clock_;
        EngineConfig config_;
        UserLockTable locks_;
    };

} // namespace creditkit
