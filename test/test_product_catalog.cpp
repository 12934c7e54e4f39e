#include <doctest/doctest.h>

#include <creditkit/engine/product_catalog.hpp>

using namespace creditkit;

TEST_SUITE("ProductCatalog") {
    TEST_CASE("Default catalog") {
        auto catalog = ProductCatalog::defaultCatalog();
        CHECK(catalog.size() == 8);

        auto ios = catalog.activeFor(Platform::IOS);
        REQUIRE(ios.size() == 4);
        CHECK(ios[0].id == "credits_starter_ios");
        CHECK(ios[0].packCredits() == 12);
        CHECK(ios[1].packCredits() == 40);
        CHECK(ios[2].packCredits() == 90);
        CHECK(ios[3].packCredits() == 180);
        CHECK(ios[3].price_cents == 999);

        CHECK(catalog.activeFor(Platform::Web).empty());
    }

    TEST_CASE("Lookup and replacement") {
        auto catalog = ProductCatalog::defaultCatalog();
        auto pro = catalog.findById("credits_pro_android");
        REQUIRE(pro.has_value());
        CHECK(pro->platform == Platform::Android);
        CHECK_FALSE(catalog.findById("credits_mega_ios").has_value());

        pro->active = false;
        catalog.add(*pro);
        CHECK(catalog.size() == 8);
        CHECK(catalog.activeFor(Platform::Android).size() == 3);

        CreditProduct web;
        web.id = "credits_web_100";
        web.credits = 100;
        web.platform = Platform::Web;
        catalog.add(web);
        CHECK(catalog.activeFor(Platform::Web).size() == 1);
    }

    TEST_CASE("Platform names") {
        CHECK(platformToString(Platform::Android) == "android");
        CHECK(platformFromString("ios").value() == Platform::IOS);
        CHECK_FALSE(platformFromString("windows").has_value());
    }

    TEST_CASE("Token presence verifier") {
        TokenPresenceVerifier verifier;
        CHECK(verifier.verify("receipt", Platform::IOS).value());
        CHECK_FALSE(verifier.verify("", Platform::IOS).value());
    }
}
