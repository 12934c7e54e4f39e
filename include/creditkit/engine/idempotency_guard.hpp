#pragma once

#include <creditkit/common/calendar.hpp>
#include <creditkit/storage/ledger_store.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace creditkit {

    using namespace creditkit::ledger;

    /// Outcome of reserving an idempotency key
    struct Reservation {
        bool is_new = false;
        std::optional<std::string> existing_transaction_id; // set when the key already completed
    };

    /// Deduplicates externally triggered operations by caller-supplied key.
    /// Must be used inside the caller's unit of work so that the reservation,
    /// the ledger append and the completion commit or roll back together.
    class IdempotencyGuard {
      public:
        inline IdempotencyGuard(std::shared_ptr<storage::ILedgerStore> store, std::shared_ptr<const IClock> clock,
                                dp::i64 reservation_timeout_ms = 30000, bool verbose = false)
            : store_(std::move(store)), clock_(std::move(clock)), reservation_timeout_ms_(reservation_timeout_ms),
              verbose_(verbose) {}

        /// Reserve a key for a user.
        /// New or abandoned keys are reserved; completed keys return their transaction;
        /// a pending key younger than the timeout fails OperationInProgress.
        inline dp::Result<Reservation, dp::Error> reserve(const std::string &key, const std::string &user_id) {
            if (key.empty())
                return dp::Result<Reservation, dp::Error>::err(invalid_operation("Idempotency key is empty"));

            auto existing = store_->findIdempotency(key);
            if (!existing.is_ok())
                return dp::Result<Reservation, dp::Error>::err(existing.error());

            const dp::i64 now = clock_->nowMillis();
            if (existing.value()) {
                const auto &record = *existing.value();
                if (record.user_id != user_id) {
                    return dp::Result<Reservation, dp::Error>::err(
                        invalid_operation("Idempotency key " + key + " belongs to another user"));
                }

                if (record.state == ReservationState::Completed) {
                    if (verbose_)
                        std::cout << "[idempotency] replay of " << key << " -> " << record.resulting_transaction_id
                                  << std::endl;
                    Reservation replay;
                    replay.is_new = false;
                    replay.existing_transaction_id = record.resulting_transaction_id;
                    return dp::Result<Reservation, dp::Error>::ok(replay);
                }

                if (record.state == ReservationState::Pending && now - record.updated_at < reservation_timeout_ms_) {
                    return dp::Result<Reservation, dp::Error>::err(
                        operation_in_progress("Operation " + key + " is still in progress"));
                }

                if (verbose_)
                    std::cout << "[idempotency] taking over abandoned reservation " << key << std::endl;
            }

            IdempotencyRecord record;
            record.key = key;
            record.user_id = user_id;
            record.state = ReservationState::Pending;
            record.created_at = existing.value() ? existing.value()->created_at : now;
            record.updated_at = now;

            auto saved = store_->saveIdempotency(record);
            if (!saved.is_ok())
                return dp::Result<Reservation, dp::Error>::err(saved.error());

            Reservation fresh;
            fresh.is_new = true;
            return dp::Result<Reservation, dp::Error>::ok(fresh);
        }

        /// Link a reserved key to the transaction it produced
        inline dp::Result<void, dp::Error> complete(const std::string &key, const std::string &transaction_id) {
            auto existing = store_->findIdempotency(key);
            if (!existing.is_ok())
                return dp::Result<void, dp::Error>::err(existing.error());
            if (!existing.value())
                return dp::Result<void, dp::Error>::err(not_found("No reservation for " + key));

            auto record = *existing.value();
            if (record.state == ReservationState::Completed && record.resulting_transaction_id != transaction_id) {
                return dp::Result<void, dp::Error>::err(
                    duplicate_transaction("Key " + key + " already maps to " + record.resulting_transaction_id));
            }
            record.state = ReservationState::Completed;
            record.resulting_transaction_id = transaction_id;
            record.updated_at = clock_->nowMillis();
            return store_->saveIdempotency(record);
        }

        /// Transaction a key already completed for this user, read without reserving.
        /// Fails InvalidOperation when the key belongs to another user.
        inline dp::Result<std::optional<std::string>, dp::Error> completedTransaction(const std::string &key,
                                                                                      const std::string &user_id) {
            using R = dp::Result<std::optional<std::string>, dp::Error>;
            auto existing = store_->findIdempotency(key);
            if (!existing.is_ok())
                return R::err(existing.error());
            if (!existing.value())
                return R::ok(std::nullopt);
            if (existing.value()->user_id != user_id)
                return R::err(invalid_operation("Idempotency key " + key + " belongs to another user"));
            if (existing.value()->state != ReservationState::Completed)
                return R::ok(std::nullopt);
            return R::ok(existing.value()->resulting_transaction_id);
        }

        // ===========================================
        // Key derivation
        // ===========================================

        inline static std::string purchaseKey(const std::string &platform_transaction_id) {
            return "purchase:" + platform_transaction_id;
        }

        inline static std::string dailyBonusKey(const std::string &user_id, const CalendarDate &date) {
            return "daily-bonus:" + user_id + ":" + date.toString();
        }

        inline static std::string referralKey(const std::string &referral_code, const std::string &referee_user_id,
                                              const std::string &role) {
            return "referral:" + referral_code + ":" + referee_user_id + ":" + role;
        }

      private:
        std::shared_ptr<storage::ILedgerStore> store_;
        std::shared_ptr<const IClock> clock_;
        dp::i64 reservation_timeout_ms_;
        bool verbose_;
    };

} // namespace creditkit
