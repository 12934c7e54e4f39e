#pragma once

#include <creditkit/common/error.hpp>
#include <creditkit/ledger/records.hpp>
#include <datapod/datapod.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace creditkit::storage {

    using namespace creditkit::ledger;

    /// Storage configuration
    struct OpenOptions {
        bool enable_wal = true;
        bool enable_foreign_keys = true;
        dp::i32 busy_timeout_ms = 5000;
        dp::i32 cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;
        // Bound on waiting for the store's connection lock
        dp::i64 lock_timeout_ms = 5000;
    };

    /// Atomic unit of work (RAII). Rolls back unless committed.
    class UnitOfWork {
      public:
        virtual ~UnitOfWork() = default;

        virtual dp::Result<void, dp::Error> commit() = 0;
        virtual void rollback() = 0;
    };

    // ===========================================
    // ILedgerStore - durable home of all engine state
    // ===========================================

    /// Ledger rows are append-only. Balance, bonus, idempotency and referral
    /// rows are derived state written in the same unit of work as the append.
    class ILedgerStore {
      public:
        virtual ~ILedgerStore() = default;

        /// Start a unit of work; other writers wait until it ends
        virtual dp::Result<std::unique_ptr<UnitOfWork>, dp::Error> begin() = 0;

        // ===========================================
        // Ledger
        // ===========================================

        /// Append an immutable transaction; duplicate ids are a logic error
        virtual dp::Result<std::string, dp::Error> append(const CreditTransaction &tx) = 0;

        virtual dp::Result<std::optional<CreditTransaction>, dp::Error> getTransaction(const std::string &id) = 0;

        /// Fold every transaction of a user
        virtual dp::Result<LedgerTotals, dp::Error> foldForUser(const std::string &user_id) = 0;

        virtual dp::Result<TransactionPage, dp::Error>
        listForUser(const std::string &user_id, const TransactionFilter &filter, const PageRequest &page) = 0;

        /// Every user with at least one ledger row
        virtual dp::Result<std::vector<std::string>, dp::Error> listUsers() = 0;

        // ===========================================
        // Balance cache
        // ===========================================

        virtual dp::Result<std::optional<CreditBalance>, dp::Error> loadBalance(const std::string &user_id) = 0;
        virtual dp::Result<void, dp::Error> saveBalance(const CreditBalance &balance) = 0;

        /// Drop a cache row; missing rows are not an error
        virtual dp::Result<void, dp::Error> deleteBalance(const std::string &user_id) = 0;

        /// Every user with a cache row, whether or not the ledger knows them
        virtual dp::Result<std::vector<std::string>, dp::Error> listCachedUsers() = 0;

        // ===========================================
        // Daily bonus state
        // ===========================================

        virtual dp::Result<std::optional<DailyBonusState>, dp::Error> loadBonusState(const std::string &user_id) = 0;
        virtual dp::Result<void, dp::Error> saveBonusState(const DailyBonusState &state) = 0;

        // ===========================================
        // Idempotency records
        // ===========================================

        virtual dp::Result<std::optional<IdempotencyRecord>, dp::Error> findIdempotency(const std::string &key) = 0;
        virtual dp::Result<void, dp::Error> saveIdempotency(const IdempotencyRecord &record) = 0;

        // ===========================================
        // Referrals
        // ===========================================

        virtual dp::Result<std::optional<ReferralRecord>, dp::Error>
        findReferralByReferee(const std::string &referee_user_id) = 0;
        virtual dp::Result<void, dp::Error> saveReferral(const ReferralRecord &record) = 0;
        virtual dp::Result<std::vector<ReferralRecord>, dp::Error> listReferrals() = 0;

        // ===========================================
        // Convenience
        // ===========================================

        inline dp::Result<dp::i64, dp::Error> sumForUser(const std::string &user_id) {
            auto totals = foldForUser(user_id);
            if (!totals.is_ok())
                return dp::Result<dp::i64, dp::Error>::err(totals.error());
            return dp::Result<dp::i64, dp::Error>::ok(totals.value().sum);
        }
    };

} // namespace creditkit::storage
