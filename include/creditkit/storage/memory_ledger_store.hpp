#pragma once

#include <creditkit/storage/ledger_store.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>

namespace creditkit::storage {

    // ===========================================
    // MemoryLedgerStore - in-process store
    // ===========================================

    /// Keeps everything in memory. Units of work record an undo journal and
    /// replay it on rollback. Intended for tests and embedding.
    class MemoryLedgerStore : public ILedgerStore {
      public:
        explicit MemoryLedgerStore(const OpenOptions &opts = OpenOptions{});
        ~MemoryLedgerStore() override = default;

        MemoryLedgerStore(const MemoryLedgerStore &) = delete;
        MemoryLedgerStore &operator=(const MemoryLedgerStore &) = delete;

        /// Fail every append after the next `successful_appends` with TransactionFailed
        void failAppendsAfter(dp::i64 successful_appends);

        /// Remove injected failures
        void clearFaults();

        /// Total number of ledger rows
        dp::i64 transactionCount() const;

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
        class MemoryUnitOfWork;
        friend class MemoryUnitOfWork;

        using Lock = std::unique_lock<std::recursive_timed_mutex>;

        dp::Result<Lock, dp::Error> acquire() const;
        void journal(std::function<void()> undo);
        void rollbackJournal();

        /// Saves into a keyed map and journals the previous value
        template <typename Map, typename Value> void upsert(Map &map, const std::string &key, const Value &value) {
            auto it = map.find(key);
            if (it == map.end()) {
                journal([&map, key]() { map.erase(key); });
            } else {
                Value previous = it->second;
                journal([&map, key, previous]() { map[key] = previous; });
            }
            map[key] = value;
        }

        OpenOptions options_;
        mutable std::recursive_timed_mutex mutex_;
        bool in_unit_of_work_ = false;
        std::vector<std::function<void()>> undo_;

        std::unordered_map<std::string, CreditTransaction> transactions_;
        std::map<std::string, std::vector<std::string>> user_index_; // append order per user
        std::unordered_map<std::string, CreditBalance> balances_;
        std::unordered_map<std::string, DailyBonusState> bonus_states_;
        std::unordered_map<std::string, IdempotencyRecord> idempotency_;
        std::map<std::string, ReferralRecord> referrals_;

        dp::i64 appends_before_failure_ = -1; // -1 = no fault
    };

} // namespace creditkit::storage
