#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <creditkit/storage/sqlite_ledger_store.hpp>
#include <filesystem>
#include <sqlite3.h>
#include <thread>

using namespace creditkit;
using namespace creditkit::storage;

// Test helper: cleanup database file
struct TestDB {
    std::string path;
    SqliteLedgerStore store;

    explicit TestDB(const std::string &name) : path(name + ".db") { cleanup(); }

    ~TestDB() {
        store.close();
        cleanup();
    }

    void openAndInit() {
        REQUIRE(store.open(path).is_ok());
        REQUIRE(store.initializeSchema().is_ok());
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove(path);
        }
        if (std::filesystem::exists(path + "-wal")) {
            std::filesystem::remove(path + "-wal");
        }
        if (std::filesystem::exists(path + "-shm")) {
            std::filesystem::remove(path + "-shm");
        }
    }
};

static CreditTransaction makeTx(const std::string &id, const std::string &user, TransactionType type, dp::i64 amount,
                                dp::i64 created_at) {
    CreditTransaction tx;
    tx.id = id;
    tx.user_id = user;
    tx.type = type;
    tx.amount = amount;
    tx.description = "test " + id;
    tx.created_at = created_at;
    auto digest = computeTransactionDigest(tx);
    REQUIRE(digest.is_ok());
    tx.digest = digest.value();
    return tx;
}

// ===========================================
// Lifecycle and schema
// ===========================================

TEST_CASE("SqliteLedgerStore - lifecycle") {
    TestDB db("test_ledger_lifecycle");

    SUBCASE("Open and close") {
        CHECK_FALSE(db.store.isOpen());
        REQUIRE(db.store.open(db.path).is_ok());
        CHECK(db.store.isOpen());
        db.store.close();
        CHECK_FALSE(db.store.isOpen());
    }

    SUBCASE("Opening twice is rejected") {
        REQUIRE(db.store.open(db.path).is_ok());
        auto again = db.store.open(db.path);
        REQUIRE_FALSE(again.is_ok());
        CHECK(again.error().code == ERR_INVALID_OPERATION);
    }

    SUBCASE("Calls on a closed store fail with a storage error") {
        auto balance = db.store.loadBalance("alice");
        REQUIRE_FALSE(balance.is_ok());
        CHECK(balance.error().code == ERR_TRANSACTION_FAILED);
    }

    SUBCASE("Schema migration is idempotent") {
        db.openAndInit();
        CHECK(db.store.schemaVersion() == 1);
        REQUIRE(db.store.initializeSchema().is_ok());
        CHECK(db.store.schemaVersion() == 1);
        CHECK(db.store.quickCheck());
    }
}

// ===========================================
// Ledger rows
// ===========================================

TEST_CASE("SqliteLedgerStore - append and read back") {
    TestDB db("test_ledger_append");
    db.openAndInit();

    auto tx = makeTx("ctx_1", "alice", TransactionType::Purchase, 44, 1000);
    tx.metadata["product_id"] = "credits_popular_ios";
    tx.metadata["purchase_token"] = "tok";
    tx.idempotency_key = "purchase:abc";
    tx.digest = computeTransactionDigest(tx).value();

    auto appended = db.store.append(tx);
    REQUIRE(appended.is_ok());
    CHECK(appended.value() == "ctx_1");

    auto loaded = db.store.getTransaction("ctx_1");
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().has_value());
    const auto &row = *loaded.value();
    CHECK(row.user_id == "alice");
    CHECK(row.type == TransactionType::Purchase);
    CHECK(row.amount == 44);
    CHECK(row.created_at == 1000);
    CHECK(row.metadataValue("product_id") == "credits_popular_ios");
    CHECK(row.idempotency_key.value_or("") == "purchase:abc");
    CHECK(verifyTransactionDigest(row));

    SUBCASE("Missing id reads as empty") {
        auto missing = db.store.getTransaction("ctx_nope");
        REQUIRE(missing.is_ok());
        CHECK_FALSE(missing.value().has_value());
    }

    SUBCASE("Duplicate id is a duplicate_transaction error") {
        auto dup = db.store.append(tx);
        REQUIRE_FALSE(dup.is_ok());
        CHECK(dup.error().code == ERR_DUPLICATE_TRANSACTION);
        CHECK(db.store.transactionCount().value() == 1);
    }

    SUBCASE("Rows cannot be updated or deleted") {
        sqlite3 *raw = nullptr;
        REQUIRE(sqlite3_open(db.path.c_str(), &raw) == SQLITE_OK);
        CHECK(sqlite3_exec(raw, "UPDATE credit_transactions SET amount = 1000", nullptr, nullptr, nullptr) !=
              SQLITE_OK);
        CHECK(sqlite3_exec(raw, "DELETE FROM credit_transactions", nullptr, nullptr, nullptr) != SQLITE_OK);
        sqlite3_close(raw);
        CHECK(db.store.getTransaction("ctx_1").value()->amount == 44);
    }
}

TEST_CASE("SqliteLedgerStore - fold and list") {
    TestDB db("test_ledger_list");
    db.openAndInit();

    REQUIRE(db.store.append(makeTx("t1", "alice", TransactionType::Grant, 50, 100)).is_ok());
    REQUIRE(db.store.append(makeTx("t2", "alice", TransactionType::DailyBonus, 10, 200)).is_ok());
    REQUIRE(db.store.append(makeTx("t3", "alice", TransactionType::Spend, -30, 300)).is_ok());
    REQUIRE(db.store.append(makeTx("t4", "alice", TransactionType::DailyBonus, 12, 400)).is_ok());
    REQUIRE(db.store.append(makeTx("t5", "bob", TransactionType::Grant, 5, 150)).is_ok());

    SUBCASE("Fold") {
        auto totals = db.store.foldForUser("alice");
        REQUIRE(totals.is_ok());
        CHECK(totals.value().sum == 42);
        CHECK(totals.value().earned == 72);
        CHECK(totals.value().spent == 30);
        CHECK(totals.value().count == 4);
        CHECK(totals.value().last_created_at == 400);
        CHECK(db.store.sumForUser("bob").value() == 5);
        CHECK(db.store.foldForUser("carol").value().count == 0);
    }

    SUBCASE("Newest first with paging") {
        TransactionFilter filter;
        PageRequest page{0, 3};
        auto first = db.store.listForUser("alice", filter, page);
        REQUIRE(first.is_ok());
        CHECK(first.value().total_count == 4);
        REQUIRE(first.value().transactions.size() == 3);
        CHECK(first.value().transactions[0].id == "t4");
        CHECK(first.value().transactions[2].id == "t2");

        page.offset = 3;
        auto second = db.store.listForUser("alice", filter, page);
        REQUIRE(second.value().transactions.size() == 1);
        CHECK(second.value().transactions[0].id == "t1");
    }

    SUBCASE("Type and range filters") {
        TransactionFilter filter;
        filter.type = TransactionType::DailyBonus;
        filter.newest_first = false;
        auto bonuses = db.store.listForUser("alice", filter, PageRequest{});
        REQUIRE(bonuses.value().transactions.size() == 2);
        CHECK(bonuses.value().transactions[0].id == "t2");

        TransactionFilter range;
        range.created_from = 200;
        range.created_to = 300;
        auto ranged = db.store.listForUser("alice", range, PageRequest{});
        CHECK(ranged.value().total_count == 2);
    }

    SUBCASE("Users with history") {
        auto users = db.store.listUsers();
        REQUIRE(users.is_ok());
        REQUIRE(users.value().size() == 2);
        CHECK(users.value()[0] == "alice");
        CHECK(users.value()[1] == "bob");
    }
}

// ===========================================
// Derived state
// ===========================================

TEST_CASE("SqliteLedgerStore - derived state tables") {
    TestDB db("test_ledger_derived");
    db.openAndInit();

    SUBCASE("Balance cache") {
        CHECK_FALSE(db.store.loadBalance("alice").value().has_value());
        CreditBalance balance;
        balance.user_id = "alice";
        balance.apply(50, 100);
        balance.apply(-20, 200);
        REQUIRE(db.store.saveBalance(balance).is_ok());
        auto loaded = db.store.loadBalance("alice").value();
        REQUIRE(loaded.has_value());
        CHECK(loaded->sameTotals(balance));
        CHECK(loaded->updated_at == 200);

        CHECK(db.store.listCachedUsers().value() == std::vector<std::string>{"alice"});
        REQUIRE(db.store.deleteBalance("alice").is_ok());
        REQUIRE(db.store.deleteBalance("alice").is_ok());
        CHECK_FALSE(db.store.loadBalance("alice").value().has_value());
        CHECK(db.store.listCachedUsers().value().empty());
    }

    SUBCASE("Daily bonus state") {
        DailyBonusState state;
        state.user_id = "alice";
        state.last_claim_date = CalendarDate::fromYmd(2024, 3, 10);
        state.current_streak = 3;
        state.next_eligible_date = state.last_claim_date.next();
        REQUIRE(db.store.saveBonusState(state).is_ok());
        auto loaded = db.store.loadBonusState("alice").value();
        REQUIRE(loaded.has_value());
        CHECK(loaded->last_claim_date == state.last_claim_date);
        CHECK(loaded->current_streak == 3);
    }

    SUBCASE("Idempotency records") {
        IdempotencyRecord record;
        record.key = "purchase:1";
        record.user_id = "alice";
        record.state = ReservationState::Completed;
        record.resulting_transaction_id = "ctx_9";
        REQUIRE(db.store.saveIdempotency(record).is_ok());
        auto loaded = db.store.findIdempotency("purchase:1").value();
        REQUIRE(loaded.has_value());
        CHECK(loaded->state == ReservationState::Completed);
        CHECK(loaded->resulting_transaction_id == "ctx_9");
    }

    SUBCASE("Referrals") {
        ReferralRecord record;
        record.referee_user_id = "bob";
        record.referrer_user_id = "alice";
        record.referral_code = "ALICE";
        record.type = ReferralType::Achievement;
        record.referee_transaction_id = "a";
        record.referrer_transaction_id = "b";
        REQUIRE(db.store.saveReferral(record).is_ok());
        auto loaded = db.store.findReferralByReferee("bob").value();
        REQUIRE(loaded.has_value());
        CHECK(loaded->type == ReferralType::Achievement);
        CHECK(loaded->isComplete());
        CHECK(db.store.listReferrals().value().size() == 1);

        record.referee_user_id = "alice";
        auto self = db.store.saveReferral(record);
        REQUIRE_FALSE(self.is_ok());
        CHECK(self.error().code == ERR_REFERRAL_NOT_VALID);
    }
}

// ===========================================
// Units of work
// ===========================================

TEST_CASE("SqliteLedgerStore - units of work") {
    TestDB db("test_ledger_uow");
    db.openAndInit();

    SUBCASE("Commit persists across reopen") {
        {
            auto uow = db.store.begin();
            REQUIRE(uow.is_ok());
            REQUIRE(db.store.append(makeTx("c1", "alice", TransactionType::Grant, 7, 1)).is_ok());
            REQUIRE(uow.value()->commit().is_ok());
        }
        db.store.close();
        REQUIRE(db.store.open(db.path).is_ok());
        CHECK(db.store.transactionCount().value() == 1);
    }

    SUBCASE("Dropping an uncommitted unit rolls back") {
        {
            auto uow = db.store.begin();
            REQUIRE(uow.is_ok());
            REQUIRE(db.store.append(makeTx("r1", "alice", TransactionType::Grant, 7, 1)).is_ok());
            CreditBalance balance;
            balance.user_id = "alice";
            balance.apply(7, 1);
            REQUIRE(db.store.saveBalance(balance).is_ok());
        }
        CHECK(db.store.transactionCount().value() == 0);
        CHECK_FALSE(db.store.loadBalance("alice").value().has_value());
    }

    SUBCASE("Nested units are rejected") {
        auto outer = db.store.begin();
        REQUIRE(outer.is_ok());
        auto inner = db.store.begin();
        REQUIRE_FALSE(inner.is_ok());
        CHECK(inner.error().code == ERR_INVALID_OPERATION);
    }

    SUBCASE("A held unit of work times out other threads") {
        db.store.close();
        OpenOptions opts;
        opts.lock_timeout_ms = 50;
        REQUIRE(db.store.open(db.path, opts).is_ok());

        auto held = db.store.begin();
        REQUIRE(held.is_ok());

        dp::u32 code = 0;
        std::thread other([&]() {
            auto blocked = db.store.append(makeTx("t1", "bob", TransactionType::Grant, 3, 1));
            if (!blocked.is_ok())
                code = blocked.error().code;
        });
        other.join();

        CHECK(code == ERR_STORAGE_TIMEOUT);
        REQUIRE(held.value()->commit().is_ok());
        CHECK(db.store.transactionCount().value() == 0);
    }

    SUBCASE("Commit twice is rejected") {
        auto uow = db.store.begin();
        REQUIRE(uow.is_ok());
        REQUIRE(uow.value()->commit().is_ok());
        CHECK_FALSE(uow.value()->commit().is_ok());
    }
}
