#include <catch2/catch_test_macros.hpp>
#include "cosign/ledger_state.hpp"

using namespace cosign;

namespace {
    LedgerState sample_state()
    {
        LedgerState state;
        state.owners = {"alice", "bob", "carol", "dave"};
        state.transactions.push_back(TransactionEntry{
            TransactionRecord{"alice", "bob", 100, false, 1}, {"carol"}});
        state.transactions.push_back(TransactionEntry{
            TransactionRecord{"bob", "erin", 40, true, 2}, {"alice", "dave"}});
        return state;
    }
}

TEST_CASE("LedgerState JSON layout", "[ledger_state]")
{
    auto state = sample_state();
    auto j = state.to_json();

    REQUIRE(j["owners"].size() == 4);
    REQUIRE(j["threshold"] == 2);
    REQUIRE(j["transactions"][0]["proposer"] == "alice");
    REQUIRE(j["transactions"][0]["amount"] == 100);
    REQUIRE(j["transactions"][0]["confirmed_by"][0] == "carol");
    REQUIRE(j["transactions"][1]["executed"] == true);

    auto parsed = LedgerState::parse(j.dump());
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == state);
    REQUIRE(parsed->validate().has_value());
}

TEST_CASE("LedgerState parsing reports malformed input", "[ledger_state]")
{
    SECTION("Not JSON") {
        auto res = LedgerState::parse("{owners:");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::ParsingError);
    }

    SECTION("Missing fields") {
        auto res = LedgerState::parse(R"({"owners": ["a", "b", "c", "d"]})");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::ParsingError);
    }

    SECTION("Negative amount") {
        auto j = sample_state().to_json();
        j["transactions"][0]["amount"] = -5;
        auto res = LedgerState::from_json(j);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::ParsingError);
    }
}

TEST_CASE("LedgerState validation", "[ledger_state]")
{
    auto state = sample_state();

    SECTION("Owner rules apply") {
        state.owners = {"alice", "bob", "carol"};
        REQUIRE(state.validate().error().code == ErrorCode::InvalidOwnerCount);

        state.owners = {"alice", "bob", "carol", "bob"};
        REQUIRE(state.validate().error().code == ErrorCode::DuplicateOwner);
    }

    SECTION("Threshold is fixed") {
        state.threshold = 3;
        REQUIRE(state.validate().error().code == ErrorCode::InvalidState);
    }

    SECTION("Counts must match confirmers") {
        state.transactions[0].record.confirmations = 2;
        REQUIRE(state.validate().error().code == ErrorCode::InvalidState);
    }

    SECTION("Confirmers must be distinct owners") {
        state.transactions[0].confirmed_by = {"mallory"};
        REQUIRE(state.validate().error().code == ErrorCode::InvalidState);

        state.transactions[0].confirmed_by = {"carol", "carol"};
        state.transactions[0].record.confirmations = 2;
        REQUIRE(state.validate().error().code == ErrorCode::InvalidState);
    }

    SECTION("Executed transactions need the threshold") {
        state.transactions[1].confirmed_by = {"alice"};
        state.transactions[1].record.confirmations = 1;
        REQUIRE(state.validate().error().code == ErrorCode::InvalidState);
    }

    SECTION("Proposer must be an owner") {
        state.transactions[0].record.proposer = "mallory";
        REQUIRE(state.validate().error().code == ErrorCode::InvalidState);
    }
}
