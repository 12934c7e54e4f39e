#pragma once

#include <creditkit/common/error.hpp>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

namespace creditkit {

    enum class Platform : dp::u8 {
        IOS = 0,
        Android = 1,
        Web = 2,
    };

    inline std::string platformToString(Platform platform) {
        switch (platform) {
        case Platform::IOS:
            return "ios";
        case Platform::Android:
            return "android";
        case Platform::Web:
            return "web";
        default:
            return "unknown";
        }
    }

    inline std::optional<Platform> platformFromString(const std::string &name) {
        if (name == "ios")
            return Platform::IOS;
        if (name == "android")
            return Platform::Android;
        if (name == "web")
            return Platform::Web;
        return std::nullopt;
    }

    /// Purchasable credit pack
    struct CreditProduct {
        std::string id;
        std::string name;
        dp::i64 credits{0};
        dp::i64 bonus_credits{0}; // extra credits shipped with the pack
        dp::i64 price_cents{0};
        Platform platform{Platform::IOS};
        bool active{true};

        inline dp::i64 packCredits() const { return credits + bonus_credits; }
    };

    class ProductCatalog {
      public:
        ProductCatalog() = default;
        inline explicit ProductCatalog(std::vector<CreditProduct> products) : products_(std::move(products)) {}

        /// Starter, Popular, Pro and Ultimate packs for ios and android
        inline static ProductCatalog defaultCatalog() {
            struct Tier {
                const char *key;
                const char *name;
                dp::i64 credits;
                dp::i64 bonus;
                dp::i64 price_cents;
            };
            static const Tier tiers[] = {
                {"starter", "Starter Pack", 12, 0, 99},
                {"popular", "Popular Pack", 35, 5, 299},
                {"pro", "Pro Pack", 75, 15, 499},
                {"ultimate", "Ultimate Pack", 150, 30, 999},
            };

            std::vector<CreditProduct> products;
            for (Platform platform : {Platform::IOS, Platform::Android}) {
                for (const auto &tier : tiers) {
                    CreditProduct product;
                    product.id = std::string("credits_") + tier.key + "_" + platformToString(platform);
                    product.name = tier.name;
                    product.credits = tier.credits;
                    product.bonus_credits = tier.bonus;
                    product.price_cents = tier.price_cents;
                    product.platform = platform;
                    products.push_back(product);
                }
            }
            return ProductCatalog(std::move(products));
        }

        inline void add(const CreditProduct &product) {
            for (auto &existing : products_) {
                if (existing.id == product.id) {
                    existing = product;
                    return;
                }
            }
            products_.push_back(product);
        }

        inline std::optional<CreditProduct> findById(const std::string &id) const {
            for (const auto &product : products_) {
                if (product.id == id)
                    return product;
            }
            return std::nullopt;
        }

        /// Active products sold on a platform, in catalog order
        inline std::vector<CreditProduct> activeFor(Platform platform) const {
            std::vector<CreditProduct> out;
            for (const auto &product : products_) {
                if (product.active && product.platform == platform)
                    out.push_back(product);
            }
            return out;
        }

        inline size_t size() const { return products_.size(); }

      private:
        std::vector<CreditProduct> products_;
    };

    // ===========================================
    // Receipt verification
    // ===========================================

    /// Store-receipt check performed before a purchase is credited
    class IReceiptVerifier {
      public:
        virtual ~IReceiptVerifier() = default;

        virtual dp::Result<bool, dp::Error> verify(const std::string &purchase_token, Platform platform) = 0;
    };

    /// Accepts any non-empty token; platform gateways plug in their own verifier
    class TokenPresenceVerifier : public IReceiptVerifier {
      public:
        inline dp::Result<bool, dp::Error> verify(const std::string &purchase_token, Platform) override {
            return dp::Result<bool, dp::Error>::ok(!purchase_token.empty());
        }
    };

} // namespace creditkit
