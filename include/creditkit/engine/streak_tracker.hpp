#pragma once

#include <algorithm>
#include <creditkit/common/calendar.hpp>
#include <creditkit/common/config.hpp>
#include <creditkit/storage/ledger_store.hpp>
#include <memory>
#include <optional>
#include <string>

namespace creditkit {

    using namespace creditkit::ledger;

    struct DailyBonusStatus {
        bool can_claim{false};
        dp::i64 current_streak{0}; // 0 once a day has been skipped
        dp::i64 next_bonus_amount{0};
        std::optional<CalendarDate> last_claim_date;
        CalendarDate next_eligible_date;
        CalendarDate today;
    };

    /// What a claim on `date` would grant
    struct ClaimPlan {
        CalendarDate date;
        dp::i64 prior_streak{0};
        dp::i64 new_streak{0};
        dp::i64 amount{0};
    };

    /// Daily-bonus state machine per user.
    /// Claim on last+1 extends the streak, a larger gap restarts it at 1,
    /// and a second claim on the same date is rejected.
    class StreakTracker {
      public:
        inline StreakTracker(std::shared_ptr<storage::ILedgerStore> store, std::shared_ptr<const IClock> clock,
                             EngineConfig config = EngineConfig{})
            : store_(std::move(store)), clock_(std::move(clock)), config_(config) {}

        /// base + min(streak * step, cap)
        inline static dp::i64 bonusAmountForStreak(dp::i64 streak, const EngineConfig &config = EngineConfig{}) {
            if (streak < 0)
                streak = 0;
            return config.daily_bonus_base + std::min(streak * config.daily_bonus_step, config.daily_bonus_cap);
        }

        /// Calendar date of now in the reference timezone
        inline CalendarDate today() const {
            return CalendarDate::fromMillis(clock_->nowMillis(), config_.reference_utc_offset_minutes);
        }

        inline dp::Result<DailyBonusStatus, dp::Error> getStatus(const std::string &user_id) const {
            auto state = store_->loadBonusState(user_id);
            if (!state.is_ok())
                return dp::Result<DailyBonusStatus, dp::Error>::err(state.error());

            DailyBonusStatus status;
            status.today = today();
            status.next_eligible_date = status.today;

            if (!state.value()) {
                status.can_claim = true;
                status.next_bonus_amount = bonusAmountForStreak(0, config_);
                return dp::Result<DailyBonusStatus, dp::Error>::ok(status);
            }

            const auto &s = *state.value();
            status.last_claim_date = s.last_claim_date;
            status.can_claim = s.last_claim_date < status.today;
            status.current_streak = s.last_claim_date.next() < status.today ? 0 : s.current_streak;
            // Claimed today: the next grant happens tomorrow on the current streak
            status.next_bonus_amount = bonusAmountForStreak(status.current_streak, config_);
            status.next_eligible_date = status.can_claim ? status.today : s.last_claim_date.next();
            return dp::Result<DailyBonusStatus, dp::Error>::ok(status);
        }

        /// Decide the outcome of a claim on `date` without writing anything
        inline dp::Result<ClaimPlan, dp::Error> prepareClaim(const std::string &user_id, const CalendarDate &date) const {
            auto state = store_->loadBonusState(user_id);
            if (!state.is_ok())
                return dp::Result<ClaimPlan, dp::Error>::err(state.error());

            ClaimPlan plan;
            plan.date = date;
            if (state.value()) {
                const auto &s = *state.value();
                if (date <= s.last_claim_date) {
                    return dp::Result<ClaimPlan, dp::Error>::err(
                        daily_bonus_already_claimed("Daily bonus for " + user_id + " already claimed on " +
                                                    s.last_claim_date.toString()));
                }
                if (s.last_claim_date.next() == date)
                    plan.prior_streak = s.current_streak;
            }
            plan.new_streak = plan.prior_streak + 1;
            plan.amount = bonusAmountForStreak(plan.prior_streak, config_);
            return dp::Result<ClaimPlan, dp::Error>::ok(plan);
        }

        /// Persist the claim; runs in the same unit of work as the bonus append
        inline dp::Result<DailyBonusState, dp::Error> recordClaim(const std::string &user_id, const ClaimPlan &plan) {
            DailyBonusState state;
            state.user_id = user_id;
            state.last_claim_date = plan.date;
            state.current_streak = plan.new_streak;
            state.next_eligible_date = plan.date.next();
            state.updated_at = clock_->nowMillis();

            auto saved = store_->saveBonusState(state);
            if (!saved.is_ok())
                return dp::Result<DailyBonusState, dp::Error>::err(saved.error());
            return dp::Result<DailyBonusState, dp::Error>::ok(state);
        }

        inline const EngineConfig &config() const { return config_; }

      private:
        std::shared_ptr<storage::ILedgerStore> store_;
        std::shared_ptr<const IClock> clock_;
        EngineConfig config_;
    };

} // namespace creditkit
