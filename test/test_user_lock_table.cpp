#include <doctest/doctest.h>

#include <atomic>
#include <creditkit/engine/user_lock_table.hpp>
#include <thread>
#include <vector>

using namespace creditkit;

TEST_SUITE("UserLockTable") {
    TEST_CASE("Entries live only while held") {
        UserLockTable table;
        {
            auto guard = table.lock({"bob", "alice", "alice"}, 100);
            REQUIRE(guard.is_ok());
            CHECK(guard.value().size() == 2);
            CHECK(table.activeEntries() == 2);
        }
        CHECK(table.activeEntries() == 0);
    }

    TEST_CASE("Held user times out for others") {
        UserLockTable table;
        auto held = table.lock({"alice"}, 100);
        REQUIRE(held.is_ok());

        std::atomic<bool> timed_out{false};
        std::thread other([&]() {
            auto attempt = table.lock({"bob", "alice"}, 20);
            timed_out = !attempt.is_ok() && attempt.error().code == ERR_STORAGE_TIMEOUT;
        });
        other.join();
        CHECK(timed_out.load());
        // sorted order tried alice first, so bob was never taken
        CHECK(table.activeEntries() == 1);
    }

    TEST_CASE("Different users do not contend") {
        UserLockTable table;
        auto alice = table.lock({"alice"}, 100);
        REQUIRE(alice.is_ok());
        auto bob = table.lock({"bob"}, 0);
        CHECK(bob.is_ok());
    }

    TEST_CASE("Serializes a shared counter") {
        UserLockTable table;
        int counter = 0;
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < 100; ++i) {
                    auto guard = table.lock({"alice"}, 5000);
                    if (guard.is_ok())
                        ++counter;
                }
            });
        }
        for (auto &thread : threads)
            thread.join();
        CHECK(counter == 800);
        CHECK(table.activeEntries() == 0);
    }
}
