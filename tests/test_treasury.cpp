#include <catch2/catch_test_macros.hpp>
#include "cosign/treasury.hpp"
#include <limits>

using namespace cosign;

TEST_CASE("InMemoryTreasury debits successful transfers", "[treasury]")
{
    InMemoryTreasury treasury(100);
    REQUIRE(treasury.transfer("bob", 40));
    REQUIRE(treasury.balance() == 60);

    auto payouts = treasury.payouts();
    REQUIRE(payouts.size() == 1);
    REQUIRE(payouts[0].destination == "bob");
    REQUIRE(payouts[0].amount == 40);

    SECTION("Overdrafts are declined") {
        REQUIRE_FALSE(treasury.transfer("bob", 61));
        REQUIRE(treasury.balance() == 60);
        REQUIRE(treasury.transfer("bob", 60));
        REQUIRE(treasury.balance() == 0);
    }

    SECTION("Rejected destinations are declined until accepted") {
        treasury.reject_destination("carol");
        REQUIRE_FALSE(treasury.transfer("carol", 1));
        REQUIRE(treasury.payouts().size() == 1);

        treasury.accept_destination("carol");
        REQUIRE(treasury.transfer("carol", 1));
        REQUIRE(treasury.balance() == 59);
    }

    SECTION("Deposits raise the balance") {
        REQUIRE(treasury.deposit(15).has_value());
        REQUIRE(treasury.balance() == 75);
    }

    SECTION("Deposits that would overflow are refused") {
        auto res = treasury.deposit(std::numeric_limits<Amount>::max());
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::InvalidState);
        REQUIRE(treasury.balance() == 60);

        REQUIRE(treasury.deposit(std::numeric_limits<Amount>::max() - 60).has_value());
        REQUIRE(treasury.balance() == std::numeric_limits<Amount>::max());
        REQUIRE_FALSE(treasury.deposit(1).has_value());
    }
}
