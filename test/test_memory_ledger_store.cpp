#include <doctest/doctest.h>

#include <creditkit/storage/memory_ledger_store.hpp>

using namespace creditkit;
using namespace creditkit::storage;

namespace {
    CreditTransaction memTx(const std::string &id, const std::string &user, dp::i64 amount, dp::i64 created_at) {
        CreditTransaction tx;
        tx.id = id;
        tx.user_id = user;
        tx.type = amount > 0 ? TransactionType::Grant : TransactionType::Spend;
        tx.amount = amount;
        tx.created_at = created_at;
        tx.digest = computeTransactionDigest(tx).value();
        return tx;
    }
} // namespace

TEST_SUITE("MemoryLedgerStore") {
    TEST_CASE("Rollback replays the undo journal") {
        MemoryLedgerStore store;

        CreditBalance before;
        before.user_id = "alice";
        before.apply(10, 1);
        REQUIRE(store.saveBalance(before).is_ok());

        {
            auto uow = store.begin();
            REQUIRE(uow.is_ok());
            REQUIRE(store.append(memTx("m1", "alice", 5, 2)).is_ok());
            CreditBalance after = before;
            after.apply(5, 2);
            REQUIRE(store.saveBalance(after).is_ok());

            IdempotencyRecord record;
            record.key = "k";
            record.user_id = "alice";
            REQUIRE(store.saveIdempotency(record).is_ok());
            uow.value()->rollback();
        }

        CHECK(store.transactionCount() == 0);
        CHECK(store.loadBalance("alice").value()->total_credits == 10);
        CHECK_FALSE(store.findIdempotency("k").value().has_value());
        CHECK(store.listUsers().value().empty());
    }

    TEST_CASE("Deleting a cache row is undone by rollback") {
        MemoryLedgerStore store;
        CreditBalance balance;
        balance.user_id = "ghost";
        balance.apply(100, 1);
        REQUIRE(store.saveBalance(balance).is_ok());

        {
            auto uow = store.begin();
            REQUIRE(uow.is_ok());
            REQUIRE(store.deleteBalance("ghost").is_ok());
            CHECK(store.listCachedUsers().value().empty());
            uow.value()->rollback();
        }
        CHECK(store.listCachedUsers().value() == std::vector<std::string>{"ghost"});
        CHECK(store.listUsers().value().empty());
    }

    TEST_CASE("Commit keeps writes") {
        MemoryLedgerStore store;
        {
            auto uow = store.begin();
            REQUIRE(uow.is_ok());
            REQUIRE(store.append(memTx("m1", "alice", 5, 2)).is_ok());
            REQUIRE(uow.value()->commit().is_ok());
        }
        CHECK(store.transactionCount() == 1);
        CHECK(store.sumForUser("alice").value() == 5);
    }

    TEST_CASE("Injected append failures") {
        MemoryLedgerStore store;
        store.failAppendsAfter(1);

        CHECK(store.append(memTx("a", "alice", 1, 1)).is_ok());
        auto failed = store.append(memTx("b", "alice", 1, 2));
        REQUIRE_FALSE(failed.is_ok());
        CHECK(failed.error().code == ERR_TRANSACTION_FAILED);
        CHECK(isRetryable(failed.error()));

        store.clearFaults();
        CHECK(store.append(memTx("b", "alice", 1, 2)).is_ok());
        CHECK(store.transactionCount() == 2);
    }

    TEST_CASE("Duplicate ids are rejected") {
        MemoryLedgerStore store;
        REQUIRE(store.append(memTx("a", "alice", 1, 1)).is_ok());
        auto dup = store.append(memTx("a", "alice", 1, 1));
        REQUIRE_FALSE(dup.is_ok());
        CHECK(dup.error().code == ERR_DUPLICATE_TRANSACTION);
    }

    TEST_CASE("Same-instant rows keep append order") {
        MemoryLedgerStore store;
        REQUIRE(store.append(memTx("first", "alice", 1, 100)).is_ok());
        REQUIRE(store.append(memTx("second", "alice", 2, 100)).is_ok());
        REQUIRE(store.append(memTx("third", "alice", 3, 100)).is_ok());

        TransactionFilter oldest;
        oldest.newest_first = false;
        auto asc = store.listForUser("alice", oldest, PageRequest{}).value();
        REQUIRE(asc.transactions.size() == 3);
        CHECK(asc.transactions[0].id == "first");
        CHECK(asc.transactions[2].id == "third");

        auto desc = store.listForUser("alice", TransactionFilter{}, PageRequest{0, 2}).value();
        CHECK(desc.total_count == 3);
        REQUIRE(desc.transactions.size() == 2);
        CHECK(desc.transactions[0].id == "third");
    }

    TEST_CASE("Self referral records are rejected") {
        MemoryLedgerStore store;
        ReferralRecord record;
        record.referee_user_id = "alice";
        record.referrer_user_id = "alice";
        record.referral_code = "X";
        auto saved = store.saveReferral(record);
        REQUIRE_FALSE(saved.is_ok());
        CHECK(saved.error().code == ERR_REFERRAL_NOT_VALID);
    }

    TEST_CASE("Nested units of work are rejected") {
        MemoryLedgerStore store;
        auto outer = store.begin();
        REQUIRE(outer.is_ok());
        auto inner = store.begin();
        REQUIRE_FALSE(inner.is_ok());
        CHECK(inner.error().code == ERR_INVALID_OPERATION);
    }
}
