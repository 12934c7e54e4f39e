#pragma once

#include <atomic>
#include <creditkit/common/error.hpp>
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <map>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace creditkit::ledger {

    /// Why a balance changed
    enum class TransactionType : dp::u8 {
        Grant = 0,
        Spend = 1,
        Purchase = 2,
        DailyBonus = 3,
        Referral = 4,
        AdminAdd = 5,
        AdminDeduct = 6,
    };

    inline std::string transactionTypeToString(TransactionType type) {
        switch (type) {
        case TransactionType::Grant:
            return "grant";
        case TransactionType::Spend:
            return "spend";
        case TransactionType::Purchase:
            return "purchase";
        case TransactionType::DailyBonus:
            return "daily_bonus";
        case TransactionType::Referral:
            return "referral";
        case TransactionType::AdminAdd:
            return "admin_add";
        case TransactionType::AdminDeduct:
            return "admin_deduct";
        default:
            return "unknown";
        }
    }

    inline std::optional<TransactionType> transactionTypeFromString(const std::string &name) {
        static const std::vector<TransactionType> all = {
            TransactionType::Grant,    TransactionType::Spend,    TransactionType::Purchase,
            TransactionType::DailyBonus, TransactionType::Referral, TransactionType::AdminAdd,
            TransactionType::AdminDeduct};
        for (auto type : all) {
            if (transactionTypeToString(type) == name)
                return type;
        }
        return std::nullopt;
    }

    inline bool isAdminType(TransactionType type) {
        return type == TransactionType::AdminAdd || type == TransactionType::AdminDeduct;
    }

    /// Opaque audit bag (purchase token, referral code, admin id, ...)
    using Metadata = std::map<std::string, std::string>;

    /// Immutable ledger fact. Corrections are new offsetting transactions.
    struct CreditTransaction {
        std::string id;
        std::string user_id;
        TransactionType type{TransactionType::Grant};
        dp::i64 amount{0}; // positive credits in, negative credits out
        std::string description;
        dp::i64 created_at{0}; // Unix epoch milliseconds
        Metadata metadata;
        std::optional<std::string> idempotency_key;
        std::string digest; // hex SHA-256 over the fields above

        inline std::string metadataValue(const std::string &key) const {
            auto it = metadata.find(key);
            return it != metadata.end() ? it->second : "";
        }

        /// Canonical byte form covered by the audit digest.
        /// Every field is written as `<length>:<bytes>` so no text can shift between fields.
        inline std::string canonical() const {
            std::stringstream ss;
            auto field = [&ss](const std::string &value) { ss << value.size() << ':' << value; };
            field(id);
            field(user_id);
            field(transactionTypeToString(type));
            field(std::to_string(amount));
            field(description);
            field(std::to_string(created_at));
            if (idempotency_key)
                field(*idempotency_key);
            else
                ss << '-';
            ss << metadata.size() << '#';
            for (const auto &[key, value] : metadata) {
                field(key);
                field(value);
            }
            return ss.str();
        }

        inline std::string toString() const {
            std::stringstream ss;
            ss << "CreditTransaction{" << id << " user=" << user_id << " type=" << transactionTypeToString(type)
               << " amount=" << amount << "}";
            return ss.str();
        }
    };

    // ===========================================
    // Hashing (keylock)
    // ===========================================

    inline dp::Result<std::vector<uint8_t>, dp::Error> computeSHA256(const std::vector<uint8_t> &data) {
        try {
            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            auto result = crypto.hash(data);
            if (!result.success) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(transaction_failed("SHA256 hashing failed"));
            }
            return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result.data);
        } catch (const std::exception &e) {
            return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                transaction_failed(std::string("SHA256 hashing failed: ") + e.what()));
        }
    }

    inline std::string hashToHex(const std::vector<uint8_t> &hash) { return keylock::keylock::to_hex(hash); }

    inline dp::Result<std::string, dp::Error> computeTransactionDigest(const CreditTransaction &tx) {
        auto canonical = tx.canonical();
        auto hash = computeSHA256(std::vector<uint8_t>(canonical.begin(), canonical.end()));
        if (!hash.is_ok())
            return dp::Result<std::string, dp::Error>::err(hash.error());
        return dp::Result<std::string, dp::Error>::ok(hashToHex(hash.value()));
    }

    inline bool verifyTransactionDigest(const CreditTransaction &tx) {
        auto digest = computeTransactionDigest(tx);
        return digest.is_ok() && digest.value() == tx.digest;
    }

    /// Unique id: hex digest of user, instant and a process-wide sequence
    inline dp::Result<std::string, dp::Error> generateTransactionId(const std::string &user_id, dp::i64 created_at) {
        static std::atomic<dp::u64> sequence{0};
        static const dp::u64 process_salt = (static_cast<dp::u64>(std::random_device{}()) << 32) ^ std::random_device{}();
        std::stringstream ss;
        ss << user_id << '|' << created_at << '|' << sequence.fetch_add(1) << '|' << process_salt;
        auto seed = ss.str();
        auto hash = computeSHA256(std::vector<uint8_t>(seed.begin(), seed.end()));
        if (!hash.is_ok())
            return dp::Result<std::string, dp::Error>::err(hash.error());
        return dp::Result<std::string, dp::Error>::ok("ctx_" + hashToHex(hash.value()).substr(0, 32));
    }

} // namespace creditkit::ledger
