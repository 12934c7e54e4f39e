#include <creditkit/storage/memory_ledger_store.hpp>

#include <algorithm>
#include <chrono>

namespace creditkit::storage {

    // ===========================================
    // Unit of work
    // ===========================================

    class MemoryLedgerStore::MemoryUnitOfWork : public UnitOfWork {
      public:
        MemoryUnitOfWork(MemoryLedgerStore &store, Lock lock) : store_(store), lock_(std::move(lock)), active_(true) {
            store_.in_unit_of_work_ = true;
            store_.undo_.clear();
        }

        ~MemoryUnitOfWork() override { rollback(); }

        dp::Result<void, dp::Error> commit() override {
            if (!active_)
                return dp::Result<void, dp::Error>::err(invalid_operation("Unit of work already finished"));
            store_.undo_.clear();
            finish();
            return dp::Result<void, dp::Error>::ok();
        }

        void rollback() override {
            if (!active_)
                return;
            store_.rollbackJournal();
            finish();
        }

      private:
        void finish() {
            active_ = false;
            store_.in_unit_of_work_ = false;
            if (lock_.owns_lock())
                lock_.unlock();
        }

        MemoryLedgerStore &store_;
        Lock lock_;
        bool active_;
    };

    MemoryLedgerStore::MemoryLedgerStore(const OpenOptions &opts) : options_(opts) {}

    dp::Result<MemoryLedgerStore::Lock, dp::Error> MemoryLedgerStore::acquire() const {
        Lock lock(mutex_, std::defer_lock);
        if (!lock.try_lock_for(std::chrono::milliseconds(options_.lock_timeout_ms))) {
            return dp::Result<Lock, dp::Error>::err(storage_timeout("Timed out waiting for ledger store"));
        }
        return dp::Result<Lock, dp::Error>::ok(std::move(lock));
    }

    void MemoryLedgerStore::journal(std::function<void()> undo) {
        if (in_unit_of_work_)
            undo_.push_back(std::move(undo));
    }

    void MemoryLedgerStore::rollbackJournal() {
        for (auto it = undo_.rbegin(); it != undo_.rend(); ++it)
            (*it)();
        undo_.clear();
    }

    void MemoryLedgerStore::failAppendsAfter(dp::i64 successful_appends) {
        std::lock_guard<std::recursive_timed_mutex> guard(mutex_);
        appends_before_failure_ = successful_appends;
    }

    void MemoryLedgerStore::clearFaults() {
        std::lock_guard<std::recursive_timed_mutex> guard(mutex_);
        appends_before_failure_ = -1;
    }

    dp::i64 MemoryLedgerStore::transactionCount() const {
        std::lock_guard<std::recursive_timed_mutex> guard(mutex_);
        return static_cast<dp::i64>(transactions_.size());
    }

    dp::Result<std::unique_ptr<UnitOfWork>, dp::Error> MemoryLedgerStore::begin() {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<std::unique_ptr<UnitOfWork>, dp::Error>::err(lock.error());
        if (in_unit_of_work_) {
            return dp::Result<std::unique_ptr<UnitOfWork>, dp::Error>::err(
                invalid_operation("Nested unit of work is not supported"));
        }
        std::unique_ptr<UnitOfWork> uow = std::make_unique<MemoryUnitOfWork>(*this, std::move(lock.value()));
        return dp::Result<std::unique_ptr<UnitOfWork>, dp::Error>::ok(std::move(uow));
    }

    // ===========================================
    // Ledger
    // ===========================================

    dp::Result<std::string, dp::Error> MemoryLedgerStore::append(const CreditTransaction &tx) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<std::string, dp::Error>::err(lock.error());

        if (appends_before_failure_ == 0)
            return dp::Result<std::string, dp::Error>::err(transaction_failed("Injected append failure"));

        if (transactions_.count(tx.id))
            return dp::Result<std::string, dp::Error>::err(duplicate_transaction("Transaction id exists: " + tx.id));

        transactions_[tx.id] = tx;
        user_index_[tx.user_id].push_back(tx.id);
        if (appends_before_failure_ > 0)
            --appends_before_failure_;

        const std::string id = tx.id;
        const std::string user = tx.user_id;
        journal([this, id, user]() {
            transactions_.erase(id);
            auto it = user_index_.find(user);
            if (it != user_index_.end()) {
                auto &ids = it->second;
                ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
                if (ids.empty())
                    user_index_.erase(it);
            }
        });

        return dp::Result<std::string, dp::Error>::ok(tx.id);
    }

    dp::Result<std::optional<CreditTransaction>, dp::Error> MemoryLedgerStore::getTransaction(const std::string &id) {
        using R = dp::Result<std::optional<CreditTransaction>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        auto it = transactions_.find(id);
        if (it == transactions_.end())
            return R::ok(std::nullopt);
        return R::ok(it->second);
    }

    dp::Result<LedgerTotals, dp::Error> MemoryLedgerStore::foldForUser(const std::string &user_id) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<LedgerTotals, dp::Error>::err(lock.error());

        LedgerTotals totals;
        auto it = user_index_.find(user_id);
        if (it == user_index_.end())
            return dp::Result<LedgerTotals, dp::Error>::ok(totals);

        for (const auto &id : it->second) {
            const auto &tx = transactions_.at(id);
            totals.sum += tx.amount;
            if (tx.amount > 0)
                totals.earned += tx.amount;
            else
                totals.spent += -tx.amount;
            ++totals.count;
            totals.last_created_at = std::max(totals.last_created_at, tx.created_at);
        }
        return dp::Result<LedgerTotals, dp::Error>::ok(totals);
    }

    dp::Result<TransactionPage, dp::Error> MemoryLedgerStore::listForUser(const std::string &user_id,
                                                                         const TransactionFilter &filter,
                                                                         const PageRequest &page) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<TransactionPage, dp::Error>::err(lock.error());

        TransactionPage result;
        auto it = user_index_.find(user_id);
        if (it == user_index_.end())
            return dp::Result<TransactionPage, dp::Error>::ok(result);

        // Position in the append order breaks created_at ties
        std::vector<std::pair<size_t, const CreditTransaction *>> matches;
        for (size_t i = 0; i < it->second.size(); ++i) {
            const auto &tx = transactions_.at(it->second[i]);
            if (filter.type && tx.type != *filter.type)
                continue;
            if (filter.created_from && tx.created_at < *filter.created_from)
                continue;
            if (filter.created_to && tx.created_at > *filter.created_to)
                continue;
            matches.emplace_back(i, &tx);
        }

        std::sort(matches.begin(), matches.end(), [&filter](const auto &a, const auto &b) {
            if (a.second->created_at != b.second->created_at) {
                return filter.newest_first ? a.second->created_at > b.second->created_at
                                           : a.second->created_at < b.second->created_at;
            }
            return filter.newest_first ? a.first > b.first : a.first < b.first;
        });

        result.total_count = static_cast<dp::i64>(matches.size());
        dp::i64 start = std::max<dp::i64>(0, page.offset);
        dp::i64 end = std::min<dp::i64>(result.total_count, start + std::max<dp::i32>(0, page.limit));
        for (dp::i64 i = start; i < end; ++i)
            result.transactions.push_back(*matches[static_cast<size_t>(i)].second);

        return dp::Result<TransactionPage, dp::Error>::ok(std::move(result));
    }

    dp::Result<std::vector<std::string>, dp::Error> MemoryLedgerStore::listUsers() {
        using R = dp::Result<std::vector<std::string>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        std::vector<std::string> users;
        for (const auto &[user, ids] : user_index_) {
            if (!ids.empty())
                users.push_back(user);
        }
        return R::ok(std::move(users));
    }

    // ===========================================
    // Derived state
    // ===========================================

    dp::Result<std::optional<CreditBalance>, dp::Error> MemoryLedgerStore::loadBalance(const std::string &user_id) {
        using R = dp::Result<std::optional<CreditBalance>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        auto it = balances_.find(user_id);
        if (it == balances_.end())
            return R::ok(std::nullopt);
        return R::ok(it->second);
    }

    dp::Result<void, dp::Error> MemoryLedgerStore::saveBalance(const CreditBalance &balance) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<void, dp::Error>::err(lock.error());
        upsert(balances_, balance.user_id, balance);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> MemoryLedgerStore::deleteBalance(const std::string &user_id) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<void, dp::Error>::err(lock.error());

        auto it = balances_.find(user_id);
        if (it != balances_.end()) {
            CreditBalance previous = it->second;
            journal([this, previous]() { balances_[previous.user_id] = previous; });
            balances_.erase(it);
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::vector<std::string>, dp::Error> MemoryLedgerStore::listCachedUsers() {
        using R = dp::Result<std::vector<std::string>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        std::vector<std::string> users;
        users.reserve(balances_.size());
        for (const auto &[user, balance] : balances_)
            users.push_back(user);
        std::sort(users.begin(), users.end());
        return R::ok(std::move(users));
    }

    dp::Result<std::optional<DailyBonusState>, dp::Error>
    MemoryLedgerStore::loadBonusState(const std::string &user_id) {
        using R = dp::Result<std::optional<DailyBonusState>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        auto it = bonus_states_.find(user_id);
        if (it == bonus_states_.end())
            return R::ok(std::nullopt);
        return R::ok(it->second);
    }

    dp::Result<void, dp::Error> MemoryLedgerStore::saveBonusState(const DailyBonusState &state) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<void, dp::Error>::err(lock.error());
        upsert(bonus_states_, state.user_id, state);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::optional<IdempotencyRecord>, dp::Error> MemoryLedgerStore::findIdempotency(const std::string &key) {
        using R = dp::Result<std::optional<IdempotencyRecord>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        auto it = idempotency_.find(key);
        if (it == idempotency_.end())
            return R::ok(std::nullopt);
        return R::ok(it->second);
    }

    dp::Result<void, dp::Error> MemoryLedgerStore::saveIdempotency(const IdempotencyRecord &record) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<void, dp::Error>::err(lock.error());
        upsert(idempotency_, record.key, record);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::optional<ReferralRecord>, dp::Error>
    MemoryLedgerStore::findReferralByReferee(const std::string &referee_user_id) {
        using R = dp::Result<std::optional<ReferralRecord>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        auto it = referrals_.find(referee_user_id);
        if (it == referrals_.end())
            return R::ok(std::nullopt);
        return R::ok(it->second);
    }

    dp::Result<void, dp::Error> MemoryLedgerStore::saveReferral(const ReferralRecord &record) {
        auto lock = acquire();
        if (!lock.is_ok())
            return dp::Result<void, dp::Error>::err(lock.error());
        if (record.referee_user_id == record.referrer_user_id)
            return dp::Result<void, dp::Error>::err(referral_not_valid("Referral record rejected: self referral"));
        upsert(referrals_, record.referee_user_id, record);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::vector<ReferralRecord>, dp::Error> MemoryLedgerStore::listReferrals() {
        using R = dp::Result<std::vector<ReferralRecord>, dp::Error>;
        auto lock = acquire();
        if (!lock.is_ok())
            return R::err(lock.error());

        std::vector<ReferralRecord> records;
        for (const auto &[referee, record] : referrals_)
            records.push_back(record);
        std::sort(records.begin(), records.end(),
                  [](const ReferralRecord &a, const ReferralRecord &b) { return a.created_at < b.created_at; });
        return R::ok(std::move(records));
    }

} // namespace creditkit::storage
