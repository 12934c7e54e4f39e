#pragma once

#include <creditkit/storage/ledger_store.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace creditkit {

    using namespace creditkit::ledger;

    /// Cached balance compared against a fold of the ledger
    struct ReconciliationReport {
        std::string user_id;
        std::optional<CreditBalance> cached;
        CreditBalance folded;
        dp::i64 drift{0}; // cached total minus folded total
        std::vector<std::string> digest_failures;
        bool repaired{false};

        inline bool consistent() const {
            return cached.has_value() && cached->sameTotals(folded) && digest_failures.empty();
        }
    };

    /// Maintains the per-user balance cache next to every append and
    /// audits it against the ledger.
    class BalanceProjector {
      public:
        explicit BalanceProjector(std::shared_ptr<storage::ILedgerStore> store, bool verbose = false);

        /// Fast read from the cache; falls back to a fold when the cache row is missing.
        /// Fails BalanceNotFound when the user has no ledger history.
        dp::Result<CreditBalance, dp::Error> getBalance(const std::string &user_id);

        /// Always-correct read: fold of every ledger row of the user
        dp::Result<CreditBalance, dp::Error> foldBalance(const std::string &user_id);

        /// Balance to check a spend against; zero for users without history
        dp::Result<dp::i64, dp::Error> spendableCredits(const std::string &user_id);

        /// Move the cache by `amount` after an append in the caller's unit of work
        dp::Result<CreditBalance, dp::Error> applyDelta(const std::string &user_id, dp::i64 amount, dp::i64 at);

        /// Recompute one user from the ledger and report drift. With `repair` the cache is
        /// rewritten from the fold, or dropped when the user has no ledger history.
        dp::Result<ReconciliationReport, dp::Error> reconcile(const std::string &user_id, bool repair = false);

        /// Users with ledger history or a cache row, sorted; a cache row without history is drift
        dp::Result<std::vector<std::string>, dp::Error> reconcilableUsers();

      private:
        dp::Result<ReconciliationReport, dp::Error> audit(const std::string &user_id);
        dp::Result<std::vector<std::string>, dp::Error> verifyDigests(const std::string &user_id);

        std::shared_ptr<storage::ILedgerStore> store_;
        bool verbose_;

        static constexpr dp::i32 AUDIT_PAGE_SIZE = 500;
    };

} // namespace creditkit
