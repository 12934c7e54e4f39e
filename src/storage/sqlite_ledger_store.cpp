#include <creditkit/storage/sqlite_ledger_store.hpp>

#include <chrono>
#include <sqlite3.h>

namespace creditkit::storage {

    namespace {

        inline dp::i64 nowSeconds() {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        /// Prepared statement, finalized on scope exit
        class Statement {
          public:
            Statement(sqlite3 *db, const std::string &sql) : stmt_(nullptr) {
                rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
            }
            ~Statement() {
                if (stmt_)
                    sqlite3_finalize(stmt_);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
            sqlite3_stmt *get() const { return stmt_; }

            void bindText(int idx, const std::string &value) {
                sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
            }
            void bindInt64(int idx, dp::i64 value) { sqlite3_bind_int64(stmt_, idx, value); }
            void bindNull(int idx) { sqlite3_bind_null(stmt_, idx); }

            int step() { return sqlite3_step(stmt_); }

            std::string text(int col) const {
                const unsigned char *value = sqlite3_column_text(stmt_, col);
                return value ? reinterpret_cast<const char *>(value) : "";
            }
            dp::i64 int64(int col) const { return sqlite3_column_int64(stmt_, col); }
            bool isNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

          private:
            sqlite3_stmt *stmt_;
            int rc_;
        };

        inline bool isConstraint(int rc) { return (rc & 0xff) == SQLITE_CONSTRAINT; }

    } // namespace

    // ===========================================
    // Unit of work
    // ===========================================

    class SqliteLedgerStore::SqliteUnitOfWork : public UnitOfWork {
      public:
        SqliteUnitOfWork(SqliteLedgerStore &store, Lock lock) : store_(store), lock_(std::move(lock)), active_(true) {
            store_.in_unit_of_work_ = true;
        }

        ~SqliteUnitOfWork() override { rollback(); }

        dp::Result<void, dp::Error> commit() override {
            if (!active_)
                return dp::Result<void, dp::Error>::err(invalid_operation("Unit of work already finished"));
            if (sqlite3_exec(store_.db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
                auto error = store_.lastError("commit");
                rollback();
                return dp::Result<void, dp::Error>::err(error);
            }
            finish();
            return dp::Result<void, dp::Error>::ok();
        }

        void rollback() override {
            if (!active_)
                return;
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
            finish();
        }

      private:
        void finish() {
            active_ = false;
            store_.in_unit_of_work_ = false;
            if (lock_.owns_lock())
                lock_.unlock();
        }

        SqliteLedgerStore &store_;
        Lock lock_;
        bool active_;
    };

    // ===========================================
    // Lifecycle
    // ===========================================

    SqliteLedgerStore::SqliteLedgerStore() : db_(nullptr), is_open_(false), in_unit_of_work_(false) {}

    SqliteLedgerStore::~SqliteLedgerStore() { close(); }

    dp::Result<void, dp::Error> SqliteLedgerStore::open(const std::string &path, const OpenOptions &opts) {
        std::lock_guard<std::recursive_timed_mutex> guard(mutex_);
        if (db_)
            return dp::Result<void, dp::Error>::err(invalid_operation("Store already open"));

        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(transaction_failed("Cannot open " + path + ": " + msg));
        }

        db_path_ = path;
        options_ = opts;
        is_open_ = true;
        applyPragmas(opts);
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteLedgerStore::close() {
        std::lock_guard<std::recursive_timed_mutex> guard(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }
    }

    bool SqliteLedgerStore::isOpen() const {
        std::lock_guard<std::recursive_timed_mutex> guard(mutex_);
        return is_open_;
    }

    void SqliteLedgerStore::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        if (opts.enable_wal) {
            sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        if (opts.enable_foreign_keys) {
            sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
        }

        sqlite3_busy_timeout(db_, opts.busy_timeout_ms);

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
        sqlite3_exec(db_, cache_size.c_str(), nullptr, nullptr, nullptr);

        std::string sync_mode;
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        sqlite3_exec(db_, sync_mode.c_str(), nullptr, nullptr, nullptr);
    }

    dp::Result<SqliteLedgerStore::Lock, dp::Error> SqliteLedgerStore::acquire() {
        Lock lock(mutex_, std::defer_lock);
        if (!lock.try_lock_for(std::chrono::milliseconds(options_.lock_timeout_ms))) {
            return dp::Result<Lock, dp::Error>::err(storage_timeout("Timed out waiting for ledger store"));
        }
        if (!db_ || !is_open_) {
            return dp::Result<Lock, dp::Error>::err(transaction_failed("Ledger store is not open"));
        }
        return dp::Result<Lock, dp::Error>::ok(std::move(lock));
    }

    dp::Error SqliteLedgerStore::lastError(const std::string &context) const {
        int code = db_ ? (sqlite3_errcode(db_) & 0xff) : SQLITE_MISUSE;
        std::string msg = context + ": " + (db_ ? sqlite3_errmsg(db_) : "database not open");
        if (code == SQLITE_BUSY || code == SQLITE_LOCKED)
            return storage_timeout(msg);
        return transaction_failed(msg);
    }

    dp::Result<void, dp::Error> SqliteLedgerStore::exec(const std::string &sql) {
        char *err_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            std::string msg = err_msg ? err_msg : "unknown error";
            sqlite3_free(err_msg);
            return dp::Result<void, dp::Error>::err(transaction_failed("SQL error: " + msg));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Schema
    // ===========================================

    dp::Result<void, dp::Error> SqliteLedgerStore::initializeSchema() {
        auto uow = begin();
        if (!uow.is_ok())
            return dp::Result<void, dp::Error>::err(uow.error());

        auto migrations = exec(SCHEMA_MIGRATIONS_TABLE);
        if (!migrations.is_ok())
            return migrations;

        if (schemaVersion() < 1) {
            auto created = createSchemaV1();
            if (!created.is_ok())
                return created;
            auto versioned = setSchemaVersion(1);
            if (!versioned.is_ok())
                return versioned;
        }

        return uow.value()->commit();
    }

    dp::Result<void, dp::Error> SqliteLedgerStore::createSchemaV1() {
        for (const char *sql : {TRANSACTIONS_TABLE, METADATA_TABLE, BALANCES_TABLE, BONUS_STATE_TABLE,
                                IDEMPOTENCY_TABLE, REFERRALS_TABLE, TRIGGER_NO_UPDATE, TRIGGER_NO_DELETE,
                                IDX_TX_USER_CREATED, IDX_TX_USER_TYPE, IDX_TX_IDEMPOTENCY, IDX_REFERRALS_REFERRER}) {
            auto result = exec(sql);
            if (!result.is_ok())
                return result;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::i32 SqliteLedgerStore::schemaVersion() {
        auto lock = acquire();
        if (!lock.is_ok())
            return 0;

        Statement stmt(db_, "SELECT MAX(version) FROM schema_migrations");
        if (!stmt.ok())
            return 0;
        if (stmt.step() == SQLITE_ROW && !stmt.isNull(0))
            return static_cast<dp::i32>(stmt.int64(0));
        return 0;
    }

    dp::Result<void, dp::Error> SqliteLedgerStore::setSchemaVersion(dp::i32 version) {
        Statement stmt(db_, "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)");
        if (!stmt.ok())
            return dp::Result<void, dp::Error>::err(lastError("set schema version"));
        stmt.bindInt64(1, version);
        stmt.bindInt64(2, nowSeconds());
        if (stmt.step() != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(lastError("set schema version"));
        return dp::Result<void, dp::Error>::ok();
    }

    bool SqliteLedgerStore::quickCheck() {
        auto lock = acquire();
        if (!lock.is_ok())
            return false;

        Statement stmt(db_, "PRAGMA quick_check");
        if (!stmt.ok())
            return false;
        return stmt.step() == SQLITE_ROW && stmt.text(0) == "ok";
    }

    dp::Result<dp::i64, dp::Error> SqliteLedgerStore::transactionCount() {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<dp::i64, dp::Error>::err(lock.error());

        Statement stmt(db_, "SELECT COUNT(*) FROM credit_transactions");
        if (!stmt.ok() || stmt.step() != SQLITE_ROW)
            return dp::Result<dp::i64, dp::Error>::err(lastError("count transactions"));
        return dp::Result<dp::i64, dp::Error>::ok(stmt.int64(0));
    }

    // ===========================================
    // Units of work
    // ===========================================

    dp::Result<std::unique_ptr<UnitOfWork>, dp::Error> SqliteLedgerStore::begin() {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<std::unique_ptr<UnitOfWork>, dp::Error>::err(lock.error());
        if (in_unit_of_work_) {
            return dp::Result<std::unique_ptr<UnitOfWork>, dp::Error>::err(
                invalid_operation("Nested unit of work is not supported"));
        }
        if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
            return dp::Result<std::unique_ptr<UnitOfWork>, dp::Error>::err(lastError("begin"));
        }
        std::unique_ptr<UnitOfWork> uow = std::make_unique<SqliteUnitOfWork>(*this, std::move(lock.value()));
        return dp::Result<std::unique_ptr<UnitOfWork>, dp::Error>::ok(std::move(uow));
    }

    // ===========================================
    // Ledger
    // ===========================================

    dp::Result<std::string, dp::Error> SqliteLedgerStore::append(const CreditTransaction &tx) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<std::string, dp::Error>::err(lock.error());

        Statement stmt(db_, "INSERT INTO credit_transactions (id, user_id, type, amount, description, created_at, "
                            "idempotency_key, digest) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
        if (!stmt.ok())
            return dp::Result<std::string, dp::Error>::err(lastError("prepare append"));

        stmt.bindText(1, tx.id);
        stmt.bindText(2, tx.user_id);
        stmt.bindText(3, transactionTypeToString(tx.type));
        stmt.bindInt64(4, tx.amount);
        stmt.bindText(5, tx.description);
        stmt.bindInt64(6, tx.created_at);
        if (tx.idempotency_key)
            stmt.bindText(7, *tx.idempotency_key);
        else
            stmt.bindNull(7);
        stmt.bindText(8, tx.digest);

        int rc = stmt.step();
        if (isConstraint(rc))
            return dp::Result<std::string, dp::Error>::err(duplicate_transaction("Transaction id exists: " + tx.id));
        if (rc != SQLITE_DONE)
            return dp::Result<std::string, dp::Error>::err(lastError("append"));

        for (const auto &[key, value] : tx.metadata) {
            Statement meta(db_, "INSERT INTO transaction_metadata (tx_id, key, value) VALUES (?, ?, ?)");
            if (!meta.ok())
                return dp::Result<std::string, dp::Error>::err(lastError("prepare metadata"));
            meta.bindText(1, tx.id);
            meta.bindText(2, key);
            meta.bindText(3, value);
            if (meta.step() != SQLITE_DONE)
                return dp::Result<std::string, dp::Error>::err(lastError("append metadata"));
        }

        return dp::Result<std::string, dp::Error>::ok(tx.id);
    }

    CreditTransaction SqliteLedgerStore::readTransactionRow(sqlite3_stmt *raw) {
        CreditTransaction tx;
        auto text = [raw](int col) {
            const unsigned char *value = sqlite3_column_text(raw, col);
            return std::string(value ? reinterpret_cast<const char *>(value) : "");
        };
        tx.id = text(0);
        tx.user_id = text(1);
        tx.type = transactionTypeFromString(text(2)).value_or(TransactionType::Grant);
        tx.amount = sqlite3_column_int64(raw, 3);
        tx.description = text(4);
        tx.created_at = sqlite3_column_int64(raw, 5);
        if (sqlite3_column_type(raw, 6) != SQLITE_NULL)
            tx.idempotency_key = text(6);
        tx.digest = text(7);
        return tx;
    }

    dp::Result<Metadata, dp::Error> SqliteLedgerStore::loadMetadata(const std::string &tx_id) {
        Statement stmt(db_, "SELECT key, value FROM transaction_metadata WHERE tx_id = ?");
        if (!stmt.ok())
            return dp::Result<Metadata, dp::Error>::err(lastError("prepare metadata"));
        stmt.bindText(1, tx_id);

        Metadata metadata;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            metadata[stmt.text(0)] = stmt.text(1);
        }
        if (rc != SQLITE_DONE)
            return dp::Result<Metadata, dp::Error>::err(lastError("load metadata"));
        return dp::Result<Metadata, dp::Error>::ok(std::move(metadata));
    }

    dp::Result<std::optional<CreditTransaction>, dp::Error> SqliteLedgerStore::getTransaction(const std::string &id) {
        using R = dp::Result<std::optional<CreditTransaction>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        Statement stmt(db_, "SELECT id, user_id, type, amount, description, created_at, idempotency_key, digest "
                            "FROM credit_transactions WHERE id = ?");
        if (!stmt.ok())
            return R::err(lastError("prepare get transaction"));
        stmt.bindText(1, id);

        int rc = stmt.step();
        if (rc == SQLITE_DONE)
            return R::ok(std::nullopt);
        if (rc != SQLITE_ROW)
            return R::err(lastError("get transaction"));

        auto tx = readTransactionRow(stmt.get());
        auto metadata = loadMetadata(tx.id);
        if (!metadata.is_ok())
            return R::err(metadata.error());
        tx.metadata = std::move(metadata.value());
        return R::ok(std::move(tx));
    }

    dp::Result<LedgerTotals, dp::Error> SqliteLedgerStore::foldForUser(const std::string &user_id) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<LedgerTotals, dp::Error>::err(lock.error());

        Statement stmt(db_, "SELECT COALESCE(SUM(amount), 0), "
                            "COALESCE(SUM(CASE WHEN amount > 0 THEN amount ELSE 0 END), 0), "
                            "COALESCE(SUM(CASE WHEN amount < 0 THEN -amount ELSE 0 END), 0), "
                            "COUNT(*), COALESCE(MAX(created_at), 0) "
                            "FROM credit_transactions WHERE user_id = ?");
        if (!stmt.ok())
            return dp::Result<LedgerTotals, dp::Error>::err(lastError("prepare fold"));
        stmt.bindText(1, user_id);
        if (stmt.step() != SQLITE_ROW)
            return dp::Result<LedgerTotals, dp::Error>::err(lastError("fold"));

        LedgerTotals totals;
        totals.sum = stmt.int64(0);
        totals.earned = stmt.int64(1);
        totals.spent = stmt.int64(2);
        totals.count = stmt.int64(3);
        totals.last_created_at = stmt.int64(4);
        return dp::Result<LedgerTotals, dp::Error>::ok(totals);
    }

    dp::Result<TransactionPage, dp::Error> SqliteLedgerStore::listForUser(const std::string &user_id,
                                                                         const TransactionFilter &filter,
                                                                         const PageRequest &page) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<TransactionPage, dp::Error>::err(lock.error());

        std::string where = " WHERE user_id = ?";
        if (filter.type)
            where += " AND type = ?";
        if (filter.created_from)
            where += " AND created_at >= ?";
        if (filter.created_to)
            where += " AND created_at <= ?";

        auto bindFilter = [&](Statement &stmt) {
            int idx = 1;
            stmt.bindText(idx++, user_id);
            if (filter.type)
                stmt.bindText(idx++, transactionTypeToString(*filter.type));
            if (filter.created_from)
                stmt.bindInt64(idx++, *filter.created_from);
            if (filter.created_to)
                stmt.bindInt64(idx++, *filter.created_to);
            return idx;
        };

        TransactionPage result;

        Statement count(db_, "SELECT COUNT(*) FROM credit_transactions" + where);
        if (!count.ok())
            return dp::Result<TransactionPage, dp::Error>::err(lastError("prepare count"));
        bindFilter(count);
        if (count.step() != SQLITE_ROW)
            return dp::Result<TransactionPage, dp::Error>::err(lastError("count"));
        result.total_count = count.int64(0);

        std::string order = filter.newest_first ? " ORDER BY created_at DESC, rowid DESC" : " ORDER BY created_at ASC, rowid ASC";
        Statement stmt(db_, "SELECT id, user_id, type, amount, description, created_at, idempotency_key, digest "
                            "FROM credit_transactions" +
                                where + order + " LIMIT ? OFFSET ?");
        if (!stmt.ok())
            return dp::Result<TransactionPage, dp::Error>::err(lastError("prepare list"));
        int idx = bindFilter(stmt);
        stmt.bindInt64(idx++, page.limit);
        stmt.bindInt64(idx, page.offset);

        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            result.transactions.push_back(readTransactionRow(stmt.get()));
        }
        if (rc != SQLITE_DONE)
            return dp::Result<TransactionPage, dp::Error>::err(lastError("list"));

        for (auto &tx : result.transactions) {
            auto metadata = loadMetadata(tx.id);
            if (!metadata.is_ok())
                return dp::Result<TransactionPage, dp::Error>::err(metadata.error());
            tx.metadata = std::move(metadata.value());
        }

        return dp::Result<TransactionPage, dp::Error>::ok(std::move(result));
    }

    dp::Result<std::vector<std::string>, dp::Error> SqliteLedgerStore::listUsers() {
        using R = dp::Result<std::vector<std::string>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        Statement stmt(db_, "SELECT DISTINCT user_id FROM credit_transactions ORDER BY user_id");
        if (!stmt.ok())
            return R::err(lastError("prepare list users"));

        std::vector<std::string> users;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            users.push_back(stmt.text(0));
        }
        if (rc != SQLITE_DONE)
            return R::err(lastError("list users"));
        return R::ok(std::move(users));
    }

    // ===========================================
    // Balance cache
    // ===========================================

    dp::Result<std::optional<CreditBalance>, dp::Error> SqliteLedgerStore::loadBalance(const std::string &user_id) {
        using R = dp::Result<std::optional<CreditBalance>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        Statement stmt(db_, "SELECT total_credits, lifetime_earned, lifetime_spent, transaction_count, updated_at "
                            "FROM credit_balances WHERE user_id = ?");
        if (!stmt.ok())
            return R::err(lastError("prepare load balance"));
        stmt.bindText(1, user_id);

        int rc = stmt.step();
        if (rc == SQLITE_DONE)
            return R::ok(std::nullopt);
        if (rc != SQLITE_ROW)
            return R::err(lastError("load balance"));

        CreditBalance balance;
        balance.user_id = user_id;
        balance.total_credits = stmt.int64(0);
        balance.lifetime_earned = stmt.int64(1);
        balance.lifetime_spent = stmt.int64(2);
        balance.transaction_count = stmt.int64(3);
        balance.updated_at = stmt.int64(4);
        return R::ok(balance);
    }

    dp::Result<void, dp::Error> SqliteLedgerStore::saveBalance(const CreditBalance &balance) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<void, dp::Error>::err(lock.error());

        Statement stmt(db_, "INSERT OR REPLACE INTO credit_balances (user_id, total_credits, lifetime_earned, "
                            "lifetime_spent, transaction_count, updated_at) VALUES (?, ?, ?, ?, ?, ?)");
        if (!stmt.ok())
            return dp::Result<void, dp::Error>::err(lastError("prepare save balance"));
        stmt.bindText(1, balance.user_id);
        stmt.bindInt64(2, balance.total_credits);
        stmt.bindInt64(3, balance.lifetime_earned);
        stmt.bindInt64(4, balance.lifetime_spent);
        stmt.bindInt64(5, balance.transaction_count);
        stmt.bindInt64(6, balance.updated_at);
        if (stmt.step() != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(lastError("save balance"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> SqliteLedgerStore::deleteBalance(const std::string &user_id) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<void, dp::Error>::err(lock.error());

        Statement stmt(db_, "DELETE FROM credit_balances WHERE user_id = ?");
        if (!stmt.ok())
            return dp::Result<void, dp::Error>::err(lastError("prepare delete balance"));
        stmt.bindText(1, user_id);
        if (stmt.step() != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(lastError("delete balance"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::vector<std::string>, dp::Error> SqliteLedgerStore::listCachedUsers() {
        using R = dp::Result<std::vector<std::string>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        Statement stmt(db_, "SELECT user_id FROM credit_balances ORDER BY user_id");
        if (!stmt.ok())
            return R::err(lastError("prepare list cached users"));

        std::vector<std::string> users;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW)
            users.push_back(stmt.text(0));
        if (rc != SQLITE_DONE)
            return R::err(lastError("list cached users"));
        return R::ok(std::move(users));
    }

    // ===========================================
    // Daily bonus state
    // ===========================================

    dp::Result<std::optional<DailyBonusState>, dp::Error>
    SqliteLedgerStore::loadBonusState(const std::string &user_id) {
        using R = dp::Result<std::optional<DailyBonusState>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        Statement stmt(db_, "SELECT last_claim_day, current_streak, next_eligible_day, updated_at "
                            "FROM daily_bonus_state WHERE user_id = ?");
        if (!stmt.ok())
            return R::err(lastError("prepare load bonus state"));
        stmt.bindText(1, user_id);

        int rc = stmt.step();
        if (rc == SQLITE_DONE)
            return R::ok(std::nullopt);
        if (rc != SQLITE_ROW)
            return R::err(lastError("load bonus state"));

        DailyBonusState state;
        state.user_id = user_id;
        state.last_claim_date = CalendarDate(stmt.int64(0));
        state.current_streak = stmt.int64(1);
        state.next_eligible_date = CalendarDate(stmt.int64(2));
        state.updated_at = stmt.int64(3);
        return R::ok(state);
    }

    dp::Result<void, dp::Error> SqliteLedgerStore::saveBonusState(const DailyBonusState &state) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<void, dp::Error>::err(lock.error());

        Statement stmt(db_, "INSERT OR REPLACE INTO daily_bonus_state (user_id, last_claim_day, current_streak, "
                            "next_eligible_day, updated_at) VALUES (?, ?, ?, ?, ?)");
        if (!stmt.ok())
            return dp::Result<void, dp::Error>::err(lastError("prepare save bonus state"));
        stmt.bindText(1, state.user_id);
        stmt.bindInt64(2, state.last_claim_date.days);
        stmt.bindInt64(3, state.current_streak);
        stmt.bindInt64(4, state.next_eligible_date.days);
        stmt.bindInt64(5, state.updated_at);
        if (stmt.step() != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(lastError("save bonus state"));
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Idempotency records
    // ===========================================

    dp::Result<std::optional<IdempotencyRecord>, dp::Error> SqliteLedgerStore::findIdempotency(const std::string &key) {
        using R = dp::Result<std::optional<IdempotencyRecord>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        Statement stmt(db_, "SELECT user_id, state, resulting_tx_id, created_at, updated_at "
                            "FROM idempotency_records WHERE key = ?");
        if (!stmt.ok())
            return R::err(lastError("prepare find idempotency"));
        stmt.bindText(1, key);

        int rc = stmt.step();
        if (rc == SQLITE_DONE)
            return R::ok(std::nullopt);
        if (rc != SQLITE_ROW)
            return R::err(lastError("find idempotency"));

        IdempotencyRecord record;
        record.key = key;
        record.user_id = stmt.text(0);
        record.state = static_cast<ReservationState>(stmt.int64(1));
        record.resulting_transaction_id = stmt.text(2);
        record.created_at = stmt.int64(3);
        record.updated_at = stmt.int64(4);
        return R::ok(record);
    }

    dp::Result<void, dp::Error> SqliteLedgerStore::saveIdempotency(const IdempotencyRecord &record) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<void, dp::Error>::err(lock.error());

        Statement stmt(db_, "INSERT OR REPLACE INTO idempotency_records (key, user_id, state, resulting_tx_id, "
                            "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?)");
        if (!stmt.ok())
            return dp::Result<void, dp::Error>::err(lastError("prepare save idempotency"));
        stmt.bindText(1, record.key);
        stmt.bindText(2, record.user_id);
        stmt.bindInt64(3, static_cast<dp::i64>(record.state));
        stmt.bindText(4, record.resulting_transaction_id);
        stmt.bindInt64(5, record.created_at);
        stmt.bindInt64(6, record.updated_at);
        if (stmt.step() != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(lastError("save idempotency"));
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Referrals
    // ===========================================

    namespace {
        ReferralRecord readReferralRow(Statement &stmt) {
            ReferralRecord record;
            record.referee_user_id = stmt.text(0);
            record.referrer_user_id = stmt.text(1);
            record.referral_code = stmt.text(2);
            record.type = referralTypeFromString(stmt.text(3)).value_or(ReferralType::Signup);
            record.referee_transaction_id = stmt.text(4);
            record.referrer_transaction_id = stmt.text(5);
            record.created_at = stmt.int64(6);
            return record;
        }

        constexpr const char *REFERRAL_COLUMNS = "SELECT referee_user_id, referrer_user_id, referral_code, type, "
                                                 "referee_tx_id, referrer_tx_id, created_at FROM credit_referrals";
    } // namespace

    dp::Result<std::optional<ReferralRecord>, dp::Error>
    SqliteLedgerStore::findReferralByReferee(const std::string &referee_user_id) {
        using R = dp::Result<std::optional<ReferralRecord>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        Statement stmt(db_, std::string(REFERRAL_COLUMNS) + " WHERE referee_user_id = ?");
        if (!stmt.ok())
            return R::err(lastError("prepare find referral"));
        stmt.bindText(1, referee_user_id);

        int rc = stmt.step();
        if (rc == SQLITE_DONE)
            return R::ok(std::nullopt);
        if (rc != SQLITE_ROW)
            return R::err(lastError("find referral"));
        return R::ok(readReferralRow(stmt));
    }

    dp::Result<void, dp::Error> SqliteLedgerStore::saveReferral(const ReferralRecord &record) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<void, dp::Error>::err(lock.error());

        Statement stmt(db_, "INSERT OR REPLACE INTO credit_referrals (referee_user_id, referrer_user_id, "
                            "referral_code, type, referee_tx_id, referrer_tx_id, created_at) "
                            "VALUES (?, ?, ?, ?, ?, ?, ?)");
        if (!stmt.ok())
            return dp::Result<void, dp::Error>::err(lastError("prepare save referral"));
        stmt.bindText(1, record.referee_user_id);
        stmt.bindText(2, record.referrer_user_id);
        stmt.bindText(3, record.referral_code);
        stmt.bindText(4, referralTypeToString(record.type));
        stmt.bindText(5, record.referee_transaction_id);
        stmt.bindText(6, record.referrer_transaction_id);
        stmt.bindInt64(7, record.created_at);

        int rc = stmt.step();
        if (isConstraint(rc))
            return dp::Result<void, dp::Error>::err(referral_not_valid("Referral record rejected: " +
                                                                       std::string(sqlite3_errmsg(db_))));
        if (rc != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(lastError("save referral"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::vector<ReferralRecord>, dp::Error> SqliteLedgerStore::listReferrals() {
        using R = dp::Result<std::vector<ReferralRecord>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        Statement stmt(db_, std::string(REFERRAL_COLUMNS) + " ORDER BY created_at");
        if (!stmt.ok())
            return R::err(lastError("prepare list referrals"));

        std::vector<ReferralRecord> records;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            records.push_back(readReferralRow(stmt));
        }
        if (rc != SQLITE_DONE)
            return R::err(lastError("list referrals"));
        return R::ok(std::move(records));
    }

} // namespace creditkit::storage
