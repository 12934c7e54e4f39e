#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <datapod/datapod.hpp>
#include <string>

namespace creditkit {

    constexpr dp::i64 MILLIS_PER_MINUTE = 60LL * 1000;
    constexpr dp::i64 MILLIS_PER_DAY = 24LL * 60 * MILLIS_PER_MINUTE;

    /// Floor division for negative instants (before 1970)
    inline dp::i64 floorDiv(dp::i64 a, dp::i64 b) {
        dp::i64 q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0)))
            --q;
        return q;
    }

    /// Calendar date stored as days since 1970-01-01
    struct CalendarDate {
        dp::i64 days{0};

        CalendarDate() = default;
        explicit CalendarDate(dp::i64 d) : days(d) {}

        /// Days from civil date (proleptic Gregorian)
        inline static CalendarDate fromYmd(dp::i32 year, dp::u32 month, dp::u32 day) {
            year -= month <= 2 ? 1 : 0;
            const dp::i64 era = (year >= 0 ? year : year - 399) / 400;
            const dp::u32 yoe = static_cast<dp::u32>(year - era * 400);
            const dp::u32 doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
            const dp::u32 doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return CalendarDate(era * 146097 + static_cast<dp::i64>(doe) - 719468);
        }

        /// Calendar date of an instant as seen in a timezone with the given UTC offset
        inline static CalendarDate fromMillis(dp::i64 epoch_ms, dp::i32 utc_offset_minutes = 0) {
            return CalendarDate(floorDiv(epoch_ms + utc_offset_minutes * MILLIS_PER_MINUTE, MILLIS_PER_DAY));
        }

        inline void toYmd(dp::i32 &year, dp::u32 &month, dp::u32 &day) const {
            const dp::i64 z = days + 719468;
            const dp::i64 era = (z >= 0 ? z : z - 146096) / 146097;
            const dp::u32 doe = static_cast<dp::u32>(z - era * 146097);
            const dp::u32 yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const dp::u32 doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const dp::u32 mp = (5 * doy + 2) / 153;
            day = doy - (153 * mp + 2) / 5 + 1;
            month = mp < 10 ? mp + 3 : mp - 9;
            year = static_cast<dp::i32>(static_cast<dp::i64>(yoe) + era * 400 + (month <= 2 ? 1 : 0));
        }

        /// First millisecond of this date in the given timezone
        inline dp::i64 startMillis(dp::i32 utc_offset_minutes = 0) const {
            return days * MILLIS_PER_DAY - utc_offset_minutes * MILLIS_PER_MINUTE;
        }

        inline CalendarDate next() const { return CalendarDate(days + 1); }
        inline CalendarDate previous() const { return CalendarDate(days - 1); }
        inline CalendarDate plusDays(dp::i64 n) const { return CalendarDate(days + n); }

        /// YYYY-MM-DD
        inline std::string toString() const {
            dp::i32 y;
            dp::u32 m, d;
            toYmd(y, m, d);
            char buf[16];
            std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
            return std::string(buf);
        }

        /// YYYY-MM
        inline std::string monthKey() const { return toString().substr(0, 7); }

        inline bool operator==(const CalendarDate &o) const { return days == o.days; }
        inline bool operator!=(const CalendarDate &o) const { return days != o.days; }
        inline bool operator<(const CalendarDate &o) const { return days < o.days; }
        inline bool operator<=(const CalendarDate &o) const { return days <= o.days; }
        inline bool operator>(const CalendarDate &o) const { return days > o.days; }
    };

    /// UTC calendar month of an instant, YYYY-MM
    inline std::string utcMonthKey(dp::i64 epoch_ms) { return CalendarDate::fromMillis(epoch_ms, 0).monthKey(); }

    // ===========================================
    // Clocks
    // ===========================================

    class IClock {
      public:
        virtual ~IClock() = default;

        /// Milliseconds since Unix epoch
        virtual dp::i64 nowMillis() const = 0;
    };

    class SystemClock : public IClock {
      public:
        inline dp::i64 nowMillis() const override {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }
    };

    /// Settable clock for tests and replays
    class ManualClock : public IClock {
      public:
        inline explicit ManualClock(dp::i64 start_ms = 0) : now_ms_(start_ms) {}

        inline dp::i64 nowMillis() const override { return now_ms_.load(); }

        inline void set(dp::i64 ms) { now_ms_.store(ms); }
        inline void advance(dp::i64 ms) { now_ms_.fetch_add(ms); }
        inline void advanceDays(dp::i64 n) { now_ms_.fetch_add(n * MILLIS_PER_DAY); }

      private:
        std::atomic<dp::i64> now_ms_;
    };

} // namespace creditkit
