#include <catch2/catch_test_macros.hpp>
#include "cosign/cli.hpp"
#include "cosign/ledger_store.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace cosign;

namespace {
    class ScopedEnv {
    public:
        ScopedEnv(const char *name, const std::string &value) : name_(name) { ::setenv(name, value.c_str(), 1); }
        ~ScopedEnv() { ::unsetenv(name_); }

    private:
        const char *name_;
    };

    class TempDir {
    public:
        TempDir()
        {
            auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            path_ = std::filesystem::temp_directory_path() / std::format("cosign-cli-{}", stamp);
        }
        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        std::string str() const { return path_.string(); }

    private:
        std::filesystem::path path_;
    };

    // Runs the CLI with stdout captured.
    struct Invocation {
        int status{0};
        std::string out;

        nlohmann::json json() const { return nlohmann::json::parse(out); }
    };

    Invocation invoke(std::vector<std::string> args)
    {
        args.insert(args.begin(), "cosign");
        std::vector<char *> argv;
        for (auto &arg : args)
            argv.push_back(arg.data());

        std::ostringstream captured;
        auto *previous = std::cout.rdbuf(captured.rdbuf());
        Invocation result;
        result.status = cli::run(static_cast<int>(argv.size()), argv.data());
        std::cout.rdbuf(previous);
        result.out = captured.str();
        return result;
    }
}

TEST_CASE("Exit codes separate rejections from failures", "[cli]")
{
    REQUIRE(cli::exit_code(CosignError::not_owner("eve")) == 2);
    REQUIRE(cli::exit_code(CosignError::tx_not_found(3)) == 2);
    REQUIRE(cli::exit_code(CosignError::insufficient_confirmations(0, 1, 2)) == 2);
    REQUIRE(cli::exit_code(CosignError::duplicate_owner("bob")) == 2);
    REQUIRE(cli::exit_code(CosignError::transfer_failed(0)) == 3);
    REQUIRE(cli::exit_code(CosignError::storage("disk full")) == 1);
    REQUIRE(cli::exit_code(CosignError::config("bad")) == 1);
}

TEST_CASE("Error messages name the subject", "[cli]")
{
    REQUIRE(std::string(CosignError::not_owner("eve").what()) == "eve is not an owner");
    REQUIRE(std::string(CosignError::insufficient_confirmations(4, 1, 2).what()) ==
            "transaction 4 has 1 of 2 required confirmations");
    REQUIRE(error_code_to_string(ErrorCode::AlreadyExecuted) == "AlreadyExecuted");
}

TEST_CASE("CLI drives a ledger through RocksDB", "[cli][store]")
{
    TempDir dir;
    ScopedEnv path("COSIGN_ROCKSDB_PATH", dir.str());
    ScopedEnv owners("COSIGN_OWNERS", "alice, bob, carol, dave");
    ScopedEnv balance("COSIGN_TREASURY_BALANCE", "1000");
    ScopedEnv level("COSIGN_LOG_LEVEL", "off");

    REQUIRE(invoke({"show"}).status == 1);
    REQUIRE(invoke({"submit", "--caller", "alice", "--to", "erin", "--amount", "1"}).status == 1);

    auto init = invoke({"init"});
    REQUIRE(init.status == 0);
    REQUIRE(init.json()["threshold"] == 2);
    REQUIRE(init.json()["balance"] == 1000);
    REQUIRE(invoke({"init"}).status == 1);

    auto submitted = invoke({"submit", "--caller", "alice", "--to", "erin", "--amount", "300"});
    REQUIRE(submitted.status == 0);
    REQUIRE(submitted.json()["index"] == 0);
    REQUIRE(submitted.json()["confirmations"] == 0);

    REQUIRE(invoke({"confirm", "--caller", "bob", "--tx", "0"}).status == 0);
    auto confirmed = invoke({"confirm", "--caller", "carol", "--tx", "0"});
    REQUIRE(confirmed.status == 0);
    REQUIRE(confirmed.json()["confirmed_by"] == nlohmann::json::array({"bob", "carol"}));

    REQUIRE(invoke({"confirm", "--caller", "mallory", "--tx", "0"}).status == 2);
    REQUIRE(invoke({"execute", "--caller", "dave", "--tx", "7"}).status == 2);

    auto executed = invoke({"execute", "--caller", "dave", "--tx", "0"});
    REQUIRE(executed.status == 0);
    REQUIRE(executed.json()["executed"] == true);
    REQUIRE(invoke({"execute", "--caller", "dave", "--tx", "0"}).status == 2);

    SECTION("Overdrafts exit with the transfer failure status and persist nothing") {
        REQUIRE(invoke({"submit", "--caller", "bob", "--to", "frank", "--amount", "5000"}).status == 0);
        REQUIRE(invoke({"confirm", "--caller", "alice", "--tx", "1"}).status == 0);
        REQUIRE(invoke({"confirm", "--caller", "dave", "--tx", "1"}).status == 0);
        REQUIRE(invoke({"execute", "--caller", "carol", "--tx", "1"}).status == 3);

        auto one = invoke({"show", "--tx", "1"});
        REQUIRE(one.status == 0);
        REQUIRE(one.json()["executed"] == false);
        REQUIRE(one.json()["confirmations"] == 2);
    }

    SECTION("Show prints the whole ledger") {
        auto shown = invoke({"show"});
        REQUIRE(shown.status == 0);
        auto j = shown.json();
        REQUIRE(j["owners"] == nlohmann::json::array({"alice", "bob", "carol", "dave"}));
        REQUIRE(j["balance"] == 700);
        REQUIRE(j["transactions"].size() == 1);
        REQUIRE(j["transactions"][0]["destination"] == "erin");

        REQUIRE(invoke({"show", "--tx", "4"}).status == 2);
    }

    RocksDbLedgerStore store(dir.str());
    auto stored = store.load_balance();
    REQUIRE(stored.has_value());
    REQUIRE(**stored == Amount{700});
    auto state = store.load_state();
    REQUIRE(state.has_value());
    REQUIRE((*state)->transactions[0].record.executed);
}

TEST_CASE("CLI init rejects an invalid owner list", "[cli]")
{
    TempDir dir;
    ScopedEnv path("COSIGN_ROCKSDB_PATH", dir.str());
    ScopedEnv owners("COSIGN_OWNERS", "alice,bob,carol");
    ScopedEnv level("COSIGN_LOG_LEVEL", "off");

    REQUIRE(invoke({"init"}).status == 2);
    REQUIRE(invoke({"show"}).status == 1);
}
