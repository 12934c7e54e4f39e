#include <creditkit/engine/balance_projector.hpp>

#include <algorithm>
#include <iostream>

namespace creditkit {

    namespace {
        CreditBalance balanceFromTotals(const std::string &user_id, const LedgerTotals &totals) {
            CreditBalance balance;
            balance.user_id = user_id;
            balance.total_credits = totals.sum;
            balance.lifetime_earned = totals.earned;
            balance.lifetime_spent = totals.spent;
            balance.transaction_count = totals.count;
            balance.updated_at = totals.last_created_at;
            return balance;
        }
    } // namespace

    BalanceProjector::BalanceProjector(std::shared_ptr<storage::ILedgerStore> store, bool verbose)
        : store_(std::move(store)), verbose_(verbose) {}

    dp::Result<CreditBalance, dp::Error> BalanceProjector::getBalance(const std::string &user_id) {
        auto cached = store_->loadBalance(user_id);
        if (!cached.is_ok())
            return dp::Result<CreditBalance, dp::Error>::err(cached.error());
        if (cached.value())
            return dp::Result<CreditBalance, dp::Error>::ok(*cached.value());

        if (verbose_)
            std::cout << "[projector] no cached balance for " << user_id << ", folding ledger" << std::endl;
        return foldBalance(user_id);
    }

    dp::Result<CreditBalance, dp::Error> BalanceProjector::foldBalance(const std::string &user_id) {
        auto totals = store_->foldForUser(user_id);
        if (!totals.is_ok())
            return dp::Result<CreditBalance, dp::Error>::err(totals.error());
        if (totals.value().count == 0)
            return dp::Result<CreditBalance, dp::Error>::err(balance_not_found("No ledger history for " + user_id));
        return dp::Result<CreditBalance, dp::Error>::ok(balanceFromTotals(user_id, totals.value()));
    }

    dp::Result<dp::i64, dp::Error> BalanceProjector::spendableCredits(const std::string &user_id) {
        auto balance = getBalance(user_id);
        if (balance.is_ok())
            return dp::Result<dp::i64, dp::Error>::ok(balance.value().total_credits);
        if (balance.error().code == ERR_BALANCE_NOT_FOUND)
            return dp::Result<dp::i64, dp::Error>::ok(0);
        return dp::Result<dp::i64, dp::Error>::err(balance.error());
    }

    dp::Result<CreditBalance, dp::Error> BalanceProjector::applyDelta(const std::string &user_id, dp::i64 amount,
                                                                      dp::i64 at) {
        auto cached = store_->loadBalance(user_id);
        if (!cached.is_ok())
            return dp::Result<CreditBalance, dp::Error>::err(cached.error());

        CreditBalance next;
        if (cached.value()) {
            next = *cached.value();
            next.apply(amount, at);
        } else {
            // First row for this user, or a lost cache: the fold already includes the new row
            auto folded = foldBalance(user_id);
            if (!folded.is_ok())
                return folded;
            next = folded.value();
        }

        auto saved = store_->saveBalance(next);
        if (!saved.is_ok())
            return dp::Result<CreditBalance, dp::Error>::err(saved.error());
        return dp::Result<CreditBalance, dp::Error>::ok(next);
    }

    dp::Result<std::vector<std::string>, dp::Error> BalanceProjector::verifyDigests(const std::string &user_id) {
        using R = dp::Result<std::vector<std::string>, dp::Error>;
        std::vector<std::string> failures;

        TransactionFilter filter;
        filter.newest_first = false;
        PageRequest page;
        page.limit = AUDIT_PAGE_SIZE;

        while (true) {
            auto batch = store_->listForUser(user_id, filter, page);
            if (!batch.is_ok())
                return R::err(batch.error());
            for (const auto &tx : batch.value().transactions) {
                if (!verifyTransactionDigest(tx))
                    failures.push_back(tx.id);
            }
            page.offset += static_cast<dp::i64>(batch.value().transactions.size());
            if (batch.value().transactions.empty() || page.offset >= batch.value().total_count)
                break;
        }
        return R::ok(std::move(failures));
    }

    dp::Result<ReconciliationReport, dp::Error> BalanceProjector::audit(const std::string &user_id) {
        ReconciliationReport report;
        report.user_id = user_id;

        auto totals = store_->foldForUser(user_id);
        if (!totals.is_ok())
            return dp::Result<ReconciliationReport, dp::Error>::err(totals.error());
        report.folded = balanceFromTotals(user_id, totals.value());

        auto cached = store_->loadBalance(user_id);
        if (!cached.is_ok())
            return dp::Result<ReconciliationReport, dp::Error>::err(cached.error());
        report.cached = cached.value();
        report.drift = (report.cached ? report.cached->total_credits : 0) - report.folded.total_credits;

        auto digests = verifyDigests(user_id);
        if (!digests.is_ok())
            return dp::Result<ReconciliationReport, dp::Error>::err(digests.error());
        report.digest_failures = std::move(digests.value());

        return dp::Result<ReconciliationReport, dp::Error>::ok(std::move(report));
    }

    dp::Result<ReconciliationReport, dp::Error> BalanceProjector::reconcile(const std::string &user_id, bool repair) {
        if (user_id.empty())
            return dp::Result<ReconciliationReport, dp::Error>::err(invalid_operation("User id is empty"));

        // Hold a unit of work so no writer moves the ledger between cache read and fold
        auto uow = store_->begin();
        if (!uow.is_ok())
            return dp::Result<ReconciliationReport, dp::Error>::err(uow.error());

        auto audited = audit(user_id);
        if (!audited.is_ok())
            return audited;
        auto report = std::move(audited.value());

        bool cache_matches = report.cached.has_value() && report.cached->sameTotals(report.folded);
        bool has_history = report.folded.transaction_count > 0;

        if (!cache_matches && (has_history || report.cached.has_value())) {
            std::cerr << "[projector] balance drift for " << user_id << ": cached="
                      << (report.cached ? std::to_string(report.cached->total_credits) : std::string("none"))
                      << " ledger=" << report.folded.total_credits << std::endl;
        }
        for (const auto &id : report.digest_failures)
            std::cerr << "[projector] digest mismatch on " << id << " (user " << user_id << ")" << std::endl;

        if (repair && !cache_matches && (has_history || report.cached.has_value())) {
            auto fixed = has_history ? store_->saveBalance(report.folded) : store_->deleteBalance(user_id);
            if (!fixed.is_ok())
                return dp::Result<ReconciliationReport, dp::Error>::err(fixed.error());
            auto committed = uow.value()->commit();
            if (!committed.is_ok())
                return dp::Result<ReconciliationReport, dp::Error>::err(committed.error());
            report.repaired = true;
            if (verbose_) {
                std::cout << "[projector] " << (has_history ? "rebuilt" : "dropped orphan") << " balance cache for "
                          << user_id << std::endl;
            }
        }

        return dp::Result<ReconciliationReport, dp::Error>::ok(std::move(report));
    }

    dp::Result<std::vector<std::string>, dp::Error> BalanceProjector::reconcilableUsers() {
        using R = dp::Result<std::vector<std::string>, dp::Error>;
        auto ledger_users = store_->listUsers();
        if (!ledger_users.is_ok())
            return R::err(ledger_users.error());
        auto cached_users = store_->listCachedUsers();
        if (!cached_users.is_ok())
            return R::err(cached_users.error());

        std::vector<std::string> users = std::move(ledger_users.value());
        users.insert(users.end(), cached_users.value().begin(), cached_users.value().end());
        std::sort(users.begin(), users.end());
        users.erase(std::unique(users.begin(), users.end()), users.end());
        return R::ok(std::move(users));
    }

} // namespace creditkit
