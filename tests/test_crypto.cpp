#include <catch2/catch_test_macros.hpp>
#include "cosign/crypto.hpp"
#include <string>

using namespace cosign::crypto;

TEST_CASE("SHA-256 known digest", "[crypto]")
{
    auto hash = SHA256::hash(std::string("abc"));
    REQUIRE(SHA256::to_hex(hash) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    Bytes bytes{'a', 'b', 'c'};
    REQUIRE(SHA256::hash(bytes) == hash);
}

TEST_CASE("SHA-256 hex parsing", "[crypto]")
{
    auto hash = SHA256::hash(std::string("cosign"));
    auto hex = SHA256::to_hex(hash);
    REQUIRE(hex.size() == 64);

    auto parsed = SHA256::from_hex(hex);
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == hash);

    REQUIRE_FALSE(SHA256::from_hex("abcd").has_value());
    REQUIRE_FALSE(SHA256::from_hex(std::string(64, 'z')).has_value());
}
