#include <creditkit/engine/orchestrator.hpp>

#include <cstdlib>
#include <iostream>
#include <limits>

namespace creditkit {

    namespace {
        dp::i64 metadataInt(const CreditTransaction &tx, const std::string &key) {
            auto value = tx.metadataValue(key);
            return value.empty() ? 0 : std::strtoll(value.c_str(), nullptr, 10);
        }

        ReferralReward rewardFor(const EngineConfig &config, ReferralType type) {
            switch (type) {
            case ReferralType::Purchase:
                return config.purchase_reward;
            case ReferralType::Achievement:
                return config.achievement_reward;
            case ReferralType::Signup:
            default:
                return config.signup_reward;
            }
        }

        std::string referralDescription(ReferralType type) {
            return "Referral bonus - " + referralTypeToString(type);
        }
    } // namespace

    Orchestrator::Orchestrator(std::shared_ptr<storage::ILedgerStore> store, std::shared_ptr<IdempotencyGuard> guard,
                               std::shared_ptr<StreakTracker> streaks, std::shared_ptr<BalanceProjector> projector,
                               std::shared_ptr<AnalyticsAggregator> analytics,
                               std::shared_ptr<const ProductCatalog> catalog, std::shared_ptr<IReceiptVerifier> verifier,
                               std::shared_ptr<const IClock> clock, EngineConfig config)
        : store_(std::move(store)), guard_(std::move(guard)), streaks_(std::move(streaks)),
          projector_(std::move(projector)), analytics_(std::move(analytics)), catalog_(std::move(catalog)),
          verifier_(std::move(verifier)), clock_(std::move(clock)), config_(config) {}

    std::unique_ptr<Orchestrator> Orchestrator::create(std::shared_ptr<storage::ILedgerStore> store,
                                                       std::shared_ptr<const IClock> clock, EngineConfig config,
                                                       ProductCatalog catalog) {
        auto guard =
            std::make_shared<IdempotencyGuard>(store, clock, config.reservation_timeout_ms, config.verbose);
        auto streaks = std::make_shared<StreakTracker>(store, clock, config);
        auto projector = std::make_shared<BalanceProjector>(store, config.verbose);
        auto analytics = std::make_shared<AnalyticsAggregator>(store, projector);
        auto products = std::make_shared<const ProductCatalog>(std::move(catalog));
        auto verifier = std::make_shared<TokenPresenceVerifier>();
        return std::make_unique<Orchestrator>(store, guard, streaks, projector, analytics, products, verifier, clock,
                                              config);
    }

    // ===========================================
    // Helpers
    // ===========================================

    dp::Result<void, dp::Error> Orchestrator::validateUser(const std::string &user_id) const {
        if (user_id.empty())
            return dp::Result<void, dp::Error>::err(invalid_operation("User id is empty"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Orchestrator::validateAmount(dp::i64 amount) const {
        if (amount <= 0)
            return dp::Result<void, dp::Error>::err(
                invalid_operation("Amount must be positive, got " + std::to_string(amount)));
        if (amount > config_.max_operation_amount)
            return dp::Result<void, dp::Error>::err(invalid_operation(
                "Amount " + std::to_string(amount) + " exceeds limit " + std::to_string(config_.max_operation_amount)));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<UserLockTable::Guard, dp::Error> Orchestrator::lockUsers(std::vector<std::string> user_ids) {
        return locks_.lock(std::move(user_ids), config_.user_lock_timeout_ms);
    }

    dp::Result<Orchestrator::Written, dp::Error>
    Orchestrator::write(const std::string &user_id, TransactionType type, dp::i64 amount,
                        const std::string &description, const Metadata &metadata,
                        const std::optional<std::string> &idempotency_key) {
        using R = dp::Result<Written, dp::Error>;

        CreditTransaction tx;
        tx.user_id = user_id;
        tx.type = type;
        tx.amount = amount;
        tx.description = description;
        tx.created_at = clock_->nowMillis();
        tx.metadata = metadata;
        tx.idempotency_key = idempotency_key;

        auto id = generateTransactionId(user_id, tx.created_at);
        if (!id.is_ok())
            return R::err(id.error());
        tx.id = id.value();

        auto digest = computeTransactionDigest(tx);
        if (!digest.is_ok())
            return R::err(digest.error());
        tx.digest = digest.value();

        auto appended = store_->append(tx);
        if (!appended.is_ok())
            return R::err(appended.error());

        auto balance = projector_->applyDelta(user_id, amount, tx.created_at);
        if (!balance.is_ok())
            return R::err(balance.error());

        if (config_.verbose)
            std::cout << "[orchestrator] " << tx.toString() << " -> balance " << balance.value().total_credits
                      << std::endl;
        return R::ok(Written{std::move(tx), balance.value()});
    }

    dp::Result<Orchestrator::Written, dp::Error> Orchestrator::credit(const std::string &user_id, TransactionType type,
                                                                      dp::i64 amount, const std::string &description,
                                                                      const Metadata &metadata) {
        return write(user_id, type, amount, description, metadata, std::nullopt);
    }

    dp::Result<Orchestrator::Written, dp::Error> Orchestrator::debit(const std::string &user_id, TransactionType type,
                                                                     dp::i64 amount, const std::string &description,
                                                                     const Metadata &metadata) {
        // Authoritative read: the user lock and the unit of work are held
        auto available = projector_->spendableCredits(user_id);
        if (!available.is_ok())
            return dp::Result<Written, dp::Error>::err(available.error());
        if (available.value() < amount) {
            return dp::Result<Written, dp::Error>::err(
                insufficient_credits("User " + user_id + " has " + std::to_string(available.value()) +
                                     " credits, needs " + std::to_string(amount)));
        }
        return write(user_id, type, -amount, description, metadata, std::nullopt);
    }

    // ===========================================
    // Balance
    // ===========================================

    dp::Result<CreditBalance, dp::Error> Orchestrator::getBalance(const std::string &user_id) {
        auto valid = validateUser(user_id);
        if (!valid.is_ok())
            return dp::Result<CreditBalance, dp::Error>::err(valid.error());
        return projector_->getBalance(user_id);
    }

    dp::Result<CreditBalance, dp::Error> Orchestrator::addCredits(const std::string &user_id, dp::i64 amount,
                                                                  const std::string &description) {
        using R = dp::Result<CreditBalance, dp::Error>;
        auto valid = validateUser(user_id);
        if (!valid.is_ok())
            return failed<CreditBalance>("addCredits", valid.error());
        auto valid_amount = validateAmount(amount);
        if (!valid_amount.is_ok())
            return failed<CreditBalance>("addCredits", valid_amount.error());

        auto lock = lockUsers({user_id});
        if (!lock.is_ok())
            return failed<CreditBalance>("addCredits", lock.error());

        return inUnitOfWork<CreditBalance>("addCredits", [&]() -> R {
            auto written = credit(user_id, TransactionType::Grant, amount,
                                  description.empty() ? std::string("Credits added") : description, Metadata{});
            if (!written.is_ok())
                return R::err(written.error());
            return R::ok(written.value().balance);
        });
    }

    dp::Result<CreditBalance, dp::Error> Orchestrator::deductCredits(const std::string &user_id, dp::i64 amount,
                                                                     const std::string &description) {
        using R = dp::Result<CreditBalance, dp::Error>;
        auto valid = validateUser(user_id);
        if (!valid.is_ok())
            return failed<CreditBalance>("deductCredits", valid.error());
        auto valid_amount = validateAmount(amount);
        if (!valid_amount.is_ok())
            return failed<CreditBalance>("deductCredits", valid_amount.error());

        auto lock = lockUsers({user_id});
        if (!lock.is_ok())
            return failed<CreditBalance>("deductCredits", lock.error());

        return inUnitOfWork<CreditBalance>("deductCredits", [&]() -> R {
            auto written = debit(user_id, TransactionType::Spend, amount,
                                 description.empty() ? std::string("Credits spent") : description, Metadata{});
            if (!written.is_ok())
                return R::err(written.error());
            return R::ok(written.value().balance);
        });
    }

    // ===========================================
    // Purchases
    // ===========================================

    dp::Result<PurchaseResult, dp::Error> Orchestrator::processPurchase(const PurchaseRequest &request) {
        using R = dp::Result<PurchaseResult, dp::Error>;
        const char *op = "processPurchase";

        auto valid = validateUser(request.user_id);
        if (!valid.is_ok())
            return failed<PurchaseResult>(op, valid.error());
        if (request.product_id.empty())
            return failed<PurchaseResult>(op, invalid_purchase("Product id is empty"));
        if (request.purchase_token.empty())
            return failed<PurchaseResult>(op, invalid_purchase("Purchase token is empty"));

        const std::string store_id = request.transaction_id.empty() ? request.purchase_token : request.transaction_id;
        const std::string key = IdempotencyGuard::purchaseKey(store_id);

        // A redelivered receipt replays even if the pack was retired or the token is spent
        auto done = guard_->completedTransaction(key, request.user_id);
        if (!done.is_ok()) {
            if (done.error().code == ERR_INVALID_OPERATION)
                return failed<PurchaseResult>(op, invalid_purchase("Purchase " + store_id + " belongs to another user"));
            return failed<PurchaseResult>(op, done.error());
        }
        if (done.value()) {
            auto replay = replayPurchase(*done.value());
            if (!replay.is_ok())
                return failed<PurchaseResult>(op, replay.error());
            return replay;
        }

        auto product = catalog_->findById(request.product_id);
        if (!product)
            return failed<PurchaseResult>(op, invalid_purchase("Product " + request.product_id + " not found"));
        if (!product->active)
            return failed<PurchaseResult>(op, invalid_purchase("Product " + request.product_id + " is not on sale"));
        if (product->platform != request.platform) {
            return failed<PurchaseResult>(op, invalid_purchase("Product " + request.product_id + " is not sold on " +
                                                               platformToString(request.platform)));
        }

        auto verified = verifier_->verify(request.purchase_token, request.platform);
        if (!verified.is_ok())
            return failed<PurchaseResult>(op, verified.error());
        if (!verified.value())
            return failed<PurchaseResult>(op, invalid_purchase("Purchase verification failed"));

        auto lock = lockUsers({request.user_id});
        if (!lock.is_ok())
            return failed<PurchaseResult>(op, lock.error());

        return inUnitOfWork<PurchaseResult>(op, [&]() -> R {
            auto reservation = guard_->reserve(key, request.user_id);
            if (!reservation.is_ok()) {
                if (reservation.error().code == ERR_INVALID_OPERATION)
                    return R::err(invalid_purchase("Purchase " + store_id + " belongs to another user"));
                return R::err(reservation.error());
            }

            if (!reservation.value().is_new)
                return replayPurchase(*reservation.value().existing_transaction_id);

            PurchaseResult result;
            result.credits_granted = product->packCredits();
            result.bonus_credits = result.credits_granted * config_.purchase_bonus_percent / 100;

            Metadata metadata;
            metadata["product_id"] = product->id;
            metadata["platform"] = platformToString(request.platform);
            metadata["purchase_token"] = request.purchase_token;
            metadata["store_transaction_id"] = store_id;
            metadata["credits_granted"] = std::to_string(result.credits_granted);
            metadata["bonus_credits"] = std::to_string(result.bonus_credits);

            auto written = write(request.user_id, TransactionType::Purchase,
                                 result.credits_granted + result.bonus_credits, "Purchase: " + product->name, metadata,
                                 key);
            if (!written.is_ok())
                return R::err(written.error());

            auto completed = guard_->complete(key, written.value().transaction.id);
            if (!completed.is_ok())
                return R::err(completed.error());

            result.transaction = written.value().transaction;
            return R::ok(result);
        });
    }

    dp::Result<PurchaseResult, dp::Error> Orchestrator::replayPurchase(const std::string &transaction_id) {
        using R = dp::Result<PurchaseResult, dp::Error>;
        auto existing = store_->getTransaction(transaction_id);
        if (!existing.is_ok())
            return R::err(existing.error());
        if (!existing.value())
            return R::err(not_found("Purchase transaction " + transaction_id + " is missing"));

        PurchaseResult replay;
        replay.transaction = *existing.value();
        replay.credits_granted = metadataInt(replay.transaction, "credits_granted");
        replay.bonus_credits = metadataInt(replay.transaction, "bonus_credits");
        return R::ok(replay);
    }

    std::vector<CreditProduct> Orchestrator::getAvailableProducts(Platform platform) const {
        return catalog_->activeFor(platform);
    }

    // ===========================================
    // Daily bonus
    // ===========================================

    dp::Result<DailyBonusStatus, dp::Error> Orchestrator::getDailyBonusStatus(const std::string &user_id) {
        auto valid = validateUser(user_id);
        if (!valid.is_ok())
            return dp::Result<DailyBonusStatus, dp::Error>::err(valid.error());
        return streaks_->getStatus(user_id);
    }

    dp::Result<DailyBonusClaim, dp::Error> Orchestrator::claimDailyBonus(const std::string &user_id) {
        using R = dp::Result<DailyBonusClaim, dp::Error>;
        const char *op = "claimDailyBonus";

        auto valid = validateUser(user_id);
        if (!valid.is_ok())
            return failed<DailyBonusClaim>(op, valid.error());

        auto lock = lockUsers({user_id});
        if (!lock.is_ok())
            return failed<DailyBonusClaim>(op, lock.error());

        const CalendarDate date = streaks_->today();
        const std::string key = IdempotencyGuard::dailyBonusKey(user_id, date);

        return inUnitOfWork<DailyBonusClaim>(op, [&]() -> R {
            auto reservation = guard_->reserve(key, user_id);
            if (!reservation.is_ok())
                return R::err(reservation.error());
            if (!reservation.value().is_new)
                return R::err(daily_bonus_already_claimed("Daily bonus already claimed on " + date.toString()));

            auto plan = streaks_->prepareClaim(user_id, date);
            if (!plan.is_ok())
                return R::err(plan.error());

            Metadata metadata;
            metadata["claim_date"] = date.toString();
            metadata["streak"] = std::to_string(plan.value().new_streak);

            auto written = write(user_id, TransactionType::DailyBonus, plan.value().amount,
                                 "Daily bonus - streak " + std::to_string(plan.value().new_streak), metadata, key);
            if (!written.is_ok())
                return R::err(written.error());

            auto recorded = streaks_->recordClaim(user_id, plan.value());
            if (!recorded.is_ok())
                return R::err(recorded.error());

            auto completed = guard_->complete(key, written.value().transaction.id);
            if (!completed.is_ok())
                return R::err(completed.error());

            DailyBonusClaim claim;
            claim.transaction = written.value().transaction;
            claim.amount = plan.value().amount;
            claim.new_streak = plan.value().new_streak;
            claim.date = date;
            claim.balance = written.value().balance;
            return R::ok(claim);
        });
    }

    // ===========================================
    // Referrals
    // ===========================================

    dp::Result<std::string, dp::Error> Orchestrator::referralSide(const std::string &key, const std::string &user_id,
                                                                  dp::i64 amount, const ReferralRequest &request,
                                                                  const std::string &role) {
        using R = dp::Result<std::string, dp::Error>;

        auto reservation = guard_->reserve(key, user_id);
        if (!reservation.is_ok()) {
            if (reservation.error().code == ERR_INVALID_OPERATION)
                return R::err(referral_not_valid("Referral key " + key + " belongs to another user"));
            return R::err(reservation.error());
        }
        // A side credited earlier without its referral record is reused, not paid twice
        if (!reservation.value().is_new) {
            if (config_.verbose)
                std::cout << "[orchestrator] reusing " << role << " payout for " << key << std::endl;
            return R::ok(*reservation.value().existing_transaction_id);
        }

        Metadata metadata = request.metadata;
        metadata["referral_code"] = request.referral_code;
        metadata["referral_type"] = referralTypeToString(request.type);
        metadata["role"] = role;
        metadata["referrer_user_id"] = request.referrer_user_id;
        metadata["referee_user_id"] = request.referee_user_id;

        auto written = write(user_id, TransactionType::Referral, amount, referralDescription(request.type), metadata, key);
        if (!written.is_ok())
            return R::err(written.error());

        auto completed = guard_->complete(key, written.value().transaction.id);
        if (!completed.is_ok())
            return R::err(completed.error());
        return R::ok(written.value().transaction.id);
    }

    dp::Result<ReferralResult, dp::Error> Orchestrator::processReferral(const ReferralRequest &request) {
        using R = dp::Result<ReferralResult, dp::Error>;
        const char *op = "processReferral";

        auto valid = validateUser(request.referrer_user_id);
        if (!valid.is_ok())
            return failed<ReferralResult>(op, valid.error());
        valid = validateUser(request.referee_user_id);
        if (!valid.is_ok())
            return failed<ReferralResult>(op, valid.error());
        if (request.referral_code.empty())
            return failed<ReferralResult>(op, referral_not_valid("Referral code is empty"));
        if (request.referrer_user_id == request.referee_user_id)
            return failed<ReferralResult>(op, referral_not_valid("Users cannot refer themselves"));

        const ReferralReward reward = rewardFor(config_, request.type);

        auto lock = lockUsers({request.referrer_user_id, request.referee_user_id});
        if (!lock.is_ok())
            return failed<ReferralResult>(op, lock.error());

        return inUnitOfWork<ReferralResult>(op, [&]() -> R {
            auto existing = store_->findReferralByReferee(request.referee_user_id);
            if (!existing.is_ok())
                return R::err(existing.error());

            if (existing.value()) {
                const auto &record = *existing.value();
                bool same_request = record.referrer_user_id == request.referrer_user_id &&
                                    record.referral_code == request.referral_code && record.type == request.type;
                if (!same_request || !record.isComplete())
                    return R::err(referral_not_valid("User " + request.referee_user_id +
                                                     " has already used a referral code"));

                auto referee_tx = store_->getTransaction(record.referee_transaction_id);
                if (!referee_tx.is_ok())
                    return R::err(referee_tx.error());
                auto referrer_tx = store_->getTransaction(record.referrer_transaction_id);
                if (!referrer_tx.is_ok())
                    return R::err(referrer_tx.error());
                if (!referee_tx.value() || !referrer_tx.value())
                    return R::err(not_found("Referral transactions for " + request.referee_user_id + " are missing"));

                ReferralResult replay;
                replay.referee_credits = referee_tx.value()->amount;
                replay.referrer_credits = referrer_tx.value()->amount;
                replay.referee_transaction_id = record.referee_transaction_id;
                replay.referrer_transaction_id = record.referrer_transaction_id;
                return R::ok(replay);
            }

            auto referee_id =
                referralSide(IdempotencyGuard::referralKey(request.referral_code, request.referee_user_id, "referee"),
                             request.referee_user_id, reward.referee_credits, request, "referee");
            if (!referee_id.is_ok())
                return R::err(referee_id.error());

            auto referrer_id =
                referralSide(IdempotencyGuard::referralKey(request.referral_code, request.referee_user_id, "referrer"),
                             request.referrer_user_id, reward.referrer_credits, request, "referrer");
            if (!referrer_id.is_ok())
                return R::err(referrer_id.error());

            ReferralRecord record;
            record.referee_user_id = request.referee_user_id;
            record.referrer_user_id = request.referrer_user_id;
            record.referral_code = request.referral_code;
            record.type = request.type;
            record.referee_transaction_id = referee_id.value();
            record.referrer_transaction_id = referrer_id.value();
            record.created_at = clock_->nowMillis();

            auto saved = store_->saveReferral(record);
            if (!saved.is_ok())
                return R::err(saved.error());

            ReferralResult result;
            result.referee_credits = reward.referee_credits;
            result.referrer_credits = reward.referrer_credits;
            result.referee_transaction_id = referee_id.value();
            result.referrer_transaction_id = referrer_id.value();
            return R::ok(result);
        });
    }

    // ===========================================
    // Reads
    // ===========================================

    dp::Result<TransactionHistory, dp::Error> Orchestrator::getUserTransactions(const HistoryQuery &query) {
        using R = dp::Result<TransactionHistory, dp::Error>;

        auto valid = validateUser(query.user_id);
        if (!valid.is_ok())
            return R::err(valid.error());
        if (query.page < 1)
            return R::err(invalid_operation("Page numbers start at 1"));
        if (query.limit <= 0 || query.limit > config_.history_max_limit) {
            return R::err(invalid_operation("Page limit must be between 1 and " +
                                            std::to_string(config_.history_max_limit)));
        }
        if (query.page - 1 > std::numeric_limits<dp::i64>::max() / query.limit)
            return R::err(invalid_operation("Page " + std::to_string(query.page) + " is out of range"));
        if (query.created_from && query.created_to && *query.created_from > *query.created_to)
            return R::err(invalid_operation("History range start is after its end"));

        TransactionFilter filter;
        filter.type = query.type;
        filter.created_from = query.created_from;
        filter.created_to = query.created_to;
        filter.newest_first = query.newest_first;

        PageRequest page;
        page.offset = (query.page - 1) * query.limit;
        page.limit = query.limit;

        auto listed = store_->listForUser(query.user_id, filter, page);
        if (!listed.is_ok())
            return R::err(listed.error());

        TransactionHistory history;
        history.transactions = std::move(listed.value().transactions);
        history.total_count = listed.value().total_count;
        history.current_page = query.page;
        history.total_pages = (history.total_count + query.limit - 1) / query.limit;
        history.has_more = page.offset + static_cast<dp::i64>(history.transactions.size()) < history.total_count;

        for (const auto &tx : history.transactions) {
            auto day = CalendarDate::fromMillis(tx.created_at, config_.reference_utc_offset_minutes);
            if (history.by_day.empty() || history.by_day.back().date != day) {
                DayGroup group;
                group.date = day;
                history.by_day.push_back(group);
            }
            history.by_day.back().transactions.push_back(tx);
            history.by_day.back().net_amount += tx.amount;
        }
        return R::ok(std::move(history));
    }

    dp::Result<AnalyticsSnapshot, dp::Error> Orchestrator::getCreditAnalytics(AnalyticsQuery query) {
        if (query.page_limit > config_.analytics_page_limit)
            query.page_limit = config_.analytics_page_limit;
        if (query.max_transactions > config_.analytics_max_transactions)
            query.max_transactions = config_.analytics_max_transactions;
        return analytics_->summarize(query);
    }

    dp::Result<AnalyticsSnapshot, dp::Error> Orchestrator::getCreditAnalytics(const std::string &user_id,
                                                                              std::optional<dp::i64> created_from,
                                                                              std::optional<dp::i64> created_to,
                                                                              bool include_admin) {
        AnalyticsQuery query;
        query.user_id = user_id;
        query.created_from = created_from;
        query.created_to = created_to;
        query.include_admin = include_admin;
        query.page_limit = config_.analytics_page_limit;
        query.max_transactions = config_.analytics_max_transactions;
        return getCreditAnalytics(query);
    }

    // ===========================================
    // Administration
    // ===========================================

    dp::Result<CreditTransaction, dp::Error> Orchestrator::adminAddCredits(const std::string &user_id, dp::i64 amount,
                                                                           const std::string &reason,
                                                                           const std::string &admin_id) {
        using R = dp::Result<CreditTransaction, dp::Error>;
        const char *op = "adminAddCredits";

        auto valid = validateUser(user_id);
        if (!valid.is_ok())
            return failed<CreditTransaction>(op, valid.error());
        auto valid_amount = validateAmount(amount);
        if (!valid_amount.is_ok())
            return failed<CreditTransaction>(op, valid_amount.error());
        if (admin_id.empty())
            return failed<CreditTransaction>(op, invalid_operation("Admin adjustments require an admin id"));
        if (reason.empty())
            return failed<CreditTransaction>(op, invalid_operation("Admin adjustments require a reason"));

        auto lock = lockUsers({user_id});
        if (!lock.is_ok())
            return failed<CreditTransaction>(op, lock.error());

        return inUnitOfWork<CreditTransaction>(op, [&]() -> R {
            Metadata metadata{{"admin_id", admin_id}, {"reason", reason}};
            auto written = credit(user_id, TransactionType::AdminAdd, amount, "Admin credit: " + reason, metadata);
            if (!written.is_ok())
                return R::err(written.error());
            if (config_.verbose)
                std::cout << "[orchestrator] admin " << admin_id << " added " << amount << " credits to " << user_id
                          << std::endl;
            return R::ok(written.value().transaction);
        });
    }

    dp::Result<CreditTransaction, dp::Error> Orchestrator::adminDeductCredits(const std::string &user_id,
                                                                              dp::i64 amount,
                                                                              const std::string &reason,
                                                                              const std::string &admin_id) {
        using R = dp::Result<CreditTransaction, dp::Error>;
        const char *op = "adminDeductCredits";

        auto valid = validateUser(user_id);
        if (!valid.is_ok())
            return failed<CreditTransaction>(op, valid.error());
        auto valid_amount = validateAmount(amount);
        if (!valid_amount.is_ok())
            return failed<CreditTransaction>(op, valid_amount.error());
        if (admin_id.empty())
            return failed<CreditTransaction>(op, invalid_operation("Admin adjustments require an admin id"));
        if (reason.empty())
            return failed<CreditTransaction>(op, invalid_operation("Admin adjustments require a reason"));

        auto lock = lockUsers({user_id});
        if (!lock.is_ok())
            return failed<CreditTransaction>(op, lock.error());

        return inUnitOfWork<CreditTransaction>(op, [&]() -> R {
            Metadata metadata{{"admin_id", admin_id}, {"reason", reason}};
            auto written = debit(user_id, TransactionType::AdminDeduct, amount, "Admin debit: " + reason, metadata);
            if (!written.is_ok())
                return R::err(written.error());
            if (config_.verbose)
                std::cout << "[orchestrator] admin " << admin_id << " deducted " << amount << " credits from " << user_id
                          << std::endl;
            return R::ok(written.value().transaction);
        });
    }

    dp::Result<ReconciliationReport, dp::Error> Orchestrator::reconcileUser(const std::string &user_id, bool repair) {
        auto valid = validateUser(user_id);
        if (!valid.is_ok())
            return dp::Result<ReconciliationReport, dp::Error>::err(valid.error());

        auto lock = lockUsers({user_id});
        if (!lock.is_ok())
            return failed<ReconciliationReport>("reconcileUser", lock.error());
        return projector_->reconcile(user_id, repair);
    }

    dp::Result<ReconciliationSummary, dp::Error> Orchestrator::reconcileAll(bool repair) {
        using R = dp::Result<ReconciliationSummary, dp::Error>;
        ReconciliationSummary summary;

        auto users = projector_->reconcilableUsers();
        if (!users.is_ok())
            return failed<ReconciliationSummary>("reconcileAll", users.error());

        for (const auto &user : users.value()) {
            auto report = reconcileUser(user, repair);
            if (!report.is_ok())
                return R::err(report.error());
            summary.reports.push_back(std::move(report.value()));
        }

        auto referrals = store_->listReferrals();
        if (!referrals.is_ok())
            return failed<ReconciliationSummary>("reconcileAll", referrals.error());

        for (const auto &record : referrals.value()) {
            bool complete = record.isComplete();
            for (const auto &id : {record.referee_transaction_id, record.referrer_transaction_id}) {
                if (!complete)
                    break;
                auto tx = store_->getTransaction(id);
                if (!tx.is_ok())
                    return failed<ReconciliationSummary>("reconcileAll", tx.error());
                complete = tx.value().has_value();
            }
            if (!complete) {
                std::cerr << "[orchestrator] incomplete referral " << record.referral_code << " for "
                          << record.referee_user_id << std::endl;
                summary.incomplete_referrals.push_back(record);
            }
        }

        if (config_.verbose)
            std::cout << "[orchestrator] reconciled " << summary.reports.size() << " users, "
                      << (summary.consistent() ? "consistent" : "drift found") << std::endl;
        return R::ok(std::move(summary));
    }

} // namespace creditkit
