#pragma once

#include <creditkit/storage/ledger_store.hpp>
#include <mutex>
#include <string>

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace creditkit::storage {

    // ===========================================
    // SqliteLedgerStore - relational backing store
    // ===========================================

    class SqliteLedgerStore : public ILedgerStore {
      public:
        SqliteLedgerStore();
        ~SqliteLedgerStore() override;

        // Non-copyable, non-movable (units of work hold a reference)
        SqliteLedgerStore(const SqliteLedgerStore &) = delete;
        SqliteLedgerStore &operator=(const SqliteLedgerStore &) = delete;

        /// Open or create database at given path (":memory:" for a private in-memory database)
        /// @param path Database file path
        /// @param opts Configuration options
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close database connection
        void close();

        /// Check if database is open
        bool isOpen() const;

        /// Create tables and run pending migrations (idempotent)
        dp::Result<void, dp::Error> initializeSchema();

        /// Current schema version from schema_migrations
        dp::i32 schemaVersion();

        /// Run SQLite quick_check
        bool quickCheck();

        /// Total number of ledger rows
        dp::Result<dp::i64, dp::Error> transactionCount();

        // ===========================================
        // ILedgerStore
        // ===========================================

        dp::Result<std::unique_ptr<UnitOfWork>, dp::Error> begin() override;

        dp::Result<std::string, dp::Error> append(const CreditTransaction &tx) override;
        dp::Result<std::optional<CreditTransaction>, dp::Error> getTransaction(const std::string &id) override;
        dp::Result<LedgerTotals, dp::Error> foldForUser(const std::string &user_id) override;
        dp::Result<TransactionPage, dp::Error> listForUser(const std::string &user_id, const TransactionFilter &filter,
                                                           const PageRequest &page) override;
        dp::Result<std::vector<std::string>, dp::Error> listUsers() override;

        dp::Result<std::optional<CreditBalance>, dp::Error> loadBalance(const std::string &user_id) override;
        dp::Result<void, dp::Error> saveBalance(const CreditBalance &balance) override;
        dp::Result<void, dp::Error> deleteBalance(const std::string &user_id) override;
        dp::Result<std::vector<std::string>, dp::Error> listCachedUsers() override;

        dp::Result<std::optional<DailyBonusState>, dp::Error> loadBonusState(const std::string &user_id) override;
        dp::Result<void, dp::Error> saveBonusState(const DailyBonusState &state) override;

        dp::Result<std::optional<IdempotencyRecord>, dp::Error> findIdempotency(const std::string &key) override;
        dp::Result<void, dp::Error> saveIdempotency(const IdempotencyRecord &record) override;

        dp::Result<std::optional<ReferralRecord>, dp::Error>
        findReferralByReferee(const std::string &referee_user_id) override;
        dp::Result<void, dp::Error> saveReferral(const ReferralRecord &record) override;
        dp::Result<std::vector<ReferralRecord>, dp::Error> listReferrals() override;

      private:
        class SqliteUnitOfWork;
        friend class SqliteUnitOfWork;

        using Lock = std::unique_lock<std::recursive_timed_mutex>;

        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;
        bool in_unit_of_work_;
        OpenOptions options_;
        mutable std::recursive_timed_mutex mutex_;

        dp::Result<Lock, dp::Error> acquire();
        dp::Error lastError(const std::string &context) const;
        dp::Result<void, dp::Error> exec(const std::string &sql);
        void applyPragmas(const OpenOptions &opts);
        dp::Result<void, dp::Error> createSchemaV1();
        dp::Result<void, dp::Error> setSchemaVersion(dp::i32 version);
        dp::Result<Metadata, dp::Error> loadMetadata(const std::string &tx_id);
        CreditTransaction readTransactionRow(sqlite3_stmt *stmt);

        static constexpr dp::i32 SCHEMA_VERSION = 1;

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *TRANSACTIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS credit_transactions (
                id TEXT PRIMARY KEY,
                user_id TEXT NOT NULL,
                type TEXT NOT NULL,
                amount INTEGER NOT NULL,
                description TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                idempotency_key TEXT,
                digest TEXT NOT NULL
            )
        )";

        static constexpr const char *METADATA_TABLE = R"(
            CREATE TABLE IF NOT EXISTS transaction_metadata (
                tx_id TEXT NOT NULL,
                key TEXT NOT NULL,
                value TEXT NOT NULL,
                PRIMARY KEY (tx_id, key),
                FOREIGN KEY(tx_id) REFERENCES credit_transactions(id)
            )
        )";

        static constexpr const char *BALANCES_TABLE = R"(
            CREATE TABLE IF NOT EXISTS credit_balances (
                user_id TEXT PRIMARY KEY,
                total_credits INTEGER NOT NULL,
                lifetime_earned INTEGER NOT NULL,
                lifetime_spent INTEGER NOT NULL,
                transaction_count INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *BONUS_STATE_TABLE = R"(
            CREATE TABLE IF NOT EXISTS daily_bonus_state (
                user_id TEXT PRIMARY KEY,
                last_claim_day INTEGER NOT NULL,
                current_streak INTEGER NOT NULL CHECK (current_streak >= 0),
                next_eligible_day INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *IDEMPOTENCY_TABLE = R"(
            CREATE TABLE IF NOT EXISTS idempotency_records (
                key TEXT PRIMARY KEY,
                user_id TEXT NOT NULL,
                state INTEGER NOT NULL,
                resulting_tx_id TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *REFERRALS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS credit_referrals (
                referee_user_id TEXT PRIMARY KEY,
                referrer_user_id TEXT NOT NULL,
                referral_code TEXT NOT NULL,
                type TEXT NOT NULL,
                referee_tx_id TEXT NOT NULL,
                referrer_tx_id TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                CHECK (referee_user_id != referrer_user_id)
            )
        )";

        static constexpr const char *TRIGGER_NO_UPDATE = R"(
            CREATE TRIGGER IF NOT EXISTS credit_transactions_no_update
            BEFORE UPDATE ON credit_transactions
            BEGIN SELECT RAISE(ABORT, 'credit transactions are immutable'); END
        )";

        static constexpr const char *TRIGGER_NO_DELETE = R"(
            CREATE TRIGGER IF NOT EXISTS credit_transactions_no_delete
            BEFORE DELETE ON credit_transactions
            BEGIN SELECT RAISE(ABORT, 'credit transactions are immutable'); END
        )";

        static constexpr const char *IDX_TX_USER_CREATED =
            "CREATE INDEX IF NOT EXISTS idx_tx_user_created ON credit_transactions(user_id, created_at)";
        static constexpr const char *IDX_TX_USER_TYPE =
            "CREATE INDEX IF NOT EXISTS idx_tx_user_type ON credit_transactions(user_id, type)";
        static constexpr const char *IDX_TX_IDEMPOTENCY =
            "CREATE INDEX IF NOT EXISTS idx_tx_idempotency ON credit_transactions(idempotency_key)";
        static constexpr const char *IDX_REFERRALS_REFERRER =
            "CREATE INDEX IF NOT EXISTS idx_referrals_referrer ON credit_referrals(referrer_user_id)";
    };

} // namespace creditkit::storage
