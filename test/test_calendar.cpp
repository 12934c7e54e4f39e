#include <doctest/doctest.h>

#include <creditkit/common/calendar.hpp>

using namespace creditkit;

TEST_SUITE("Calendar") {
    TEST_CASE("Civil date conversion") {
        CHECK(CalendarDate::fromYmd(1970, 1, 1).days == 0);
        CHECK(CalendarDate::fromYmd(1970, 1, 2).days == 1);
        CHECK(CalendarDate::fromYmd(1969, 12, 31).days == -1);
        CHECK(CalendarDate::fromYmd(2000, 3, 1).days == 11017);

        dp::i32 y;
        dp::u32 m, d;
        CalendarDate::fromYmd(2024, 2, 29).toYmd(y, m, d);
        CHECK(y == 2024);
        CHECK(m == 2);
        CHECK(d == 29);
    }

    TEST_CASE("Formatting") {
        auto date = CalendarDate::fromYmd(2024, 3, 9);
        CHECK(date.toString() == "2024-03-09");
        CHECK(date.monthKey() == "2024-03");
        CHECK(CalendarDate::fromYmd(2023, 12, 31).next().toString() == "2024-01-01");
        CHECK(CalendarDate::fromYmd(2024, 3, 1).previous().toString() == "2024-02-29");
    }

    TEST_CASE("Instants map to dates in the reference timezone") {
        const dp::i64 midnight = CalendarDate::fromYmd(2024, 3, 10).startMillis();

        CHECK(CalendarDate::fromMillis(midnight) == CalendarDate::fromYmd(2024, 3, 10));
        CHECK(CalendarDate::fromMillis(midnight - 1) == CalendarDate::fromYmd(2024, 3, 9));

        SUBCASE("East of UTC the day starts earlier") {
            // 23:30 UTC on the 9th is already the 10th at UTC+01:00
            dp::i64 late = midnight - 30 * MILLIS_PER_MINUTE;
            CHECK(CalendarDate::fromMillis(late, 60) == CalendarDate::fromYmd(2024, 3, 10));
            CHECK(CalendarDate::fromYmd(2024, 3, 10).startMillis(60) == midnight - 60 * MILLIS_PER_MINUTE);
        }

        SUBCASE("West of UTC the day starts later") {
            dp::i64 early = midnight + 2 * 60 * MILLIS_PER_MINUTE;
            CHECK(CalendarDate::fromMillis(early, -300) == CalendarDate::fromYmd(2024, 3, 9));
        }

        SUBCASE("Before the epoch") {
            CHECK(CalendarDate::fromMillis(-1) == CalendarDate::fromYmd(1969, 12, 31));
            CHECK(floorDiv(-1, MILLIS_PER_DAY) == -1);
        }
    }

    TEST_CASE("Month keys are UTC") {
        const dp::i64 last_ms_of_jan = CalendarDate::fromYmd(2024, 2, 1).startMillis() - 1;
        CHECK(utcMonthKey(last_ms_of_jan) == "2024-01");
        CHECK(utcMonthKey(last_ms_of_jan + 1) == "2024-02");
    }

    TEST_CASE("Manual clock") {
        ManualClock clock(1000);
        CHECK(clock.nowMillis() == 1000);
        clock.advance(500);
        CHECK(clock.nowMillis() == 1500);
        clock.advanceDays(2);
        CHECK(clock.nowMillis() == 1500 + 2 * MILLIS_PER_DAY);
        clock.set(7);
        CHECK(clock.nowMillis() == 7);

        SystemClock system;
        CHECK(system.nowMillis() > CalendarDate::fromYmd(2020, 1, 1).startMillis());
    }
}
