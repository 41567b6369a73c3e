#include "cosign/config.hpp"
#include <toml++/toml.h>
#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>

namespace cosign
{
    namespace
    {
        constexpr std::array<std::string_view, 7> kLogLevels = {
            "trace", "debug", "info", "warn", "error", "critical", "off"};

        Result<CosignConfig> parse_toml(const toml::table &tbl, CosignConfig cfg)
        {
            if (auto ledger = tbl["ledger"].as_table())
            {
                if (auto owners = (*ledger)["owners"].as_array())
                {
                    cfg.ledger.owners.clear();
                    for (const auto &node : *owners)
                    {
                        auto owner = node.value<std::string>();
                        if (!owner)
                            return std::unexpected(CosignError::config("ledger.owners must contain strings"));
                        cfg.ledger.owners.push_back(*owner);
                    }
                }
            }

            if (auto treasury = tbl["treasury"].as_table())
            {
                if (auto balance = (*treasury)["balance"].value<int64_t>())
                {
                    if (*balance < 0)
                        return std::unexpected(CosignError::config("treasury.balance must not be negative"));
                    cfg.treasury.balance = static_cast<Amount>(*balance);
                }
            }

            if (auto storage = tbl["storage"].as_table())
            {
                if (auto path = (*storage)["rocksdb_path"].value<std::string>())
                    cfg.storage.rocksdb_path = *path;
            }

            if (auto events = tbl["events"].as_table())
            {
                if (auto enabled = (*events)["enabled"].value<bool>())
                    cfg.events.enabled = *enabled;
            }

            if (auto log = tbl["log"].as_table())
            {
                if (auto level = (*log)["level"].value<std::string>())
                    cfg.log.level = *level;
            }

            return cfg;
        }

        std::vector<Address> split_owners(std::string_view list)
        {
            std::vector<Address> out;
            while (!list.empty())
            {
                auto comma = list.find(',');
                auto item = list.substr(0, comma);
                while (!item.empty() && item.front() == ' ')
                    item.remove_prefix(1);
                while (!item.empty() && item.back() == ' ')
                    item.remove_suffix(1);
                if (!item.empty())
                    out.emplace_back(item);
                if (comma == std::string_view::npos)
                    break;
                list.remove_prefix(comma + 1);
            }
            return out;
        }
    } // namespace

    Result<CosignConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(CosignError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<CosignConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        CosignConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return parsed;
            cfg = std::move(*parsed);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(CosignError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = check(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<CosignConfig> ConfigLoader::from_env()
    {
        CosignConfig cfg{};
        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = check(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(CosignConfig &cfg)
    {
        if (const char *owners = std::getenv("COSIGN_OWNERS"))
            cfg.ledger.owners = split_owners(owners);
        if (const char *path = std::getenv("COSIGN_ROCKSDB_PATH"))
            cfg.storage.rocksdb_path = path;
        if (const char *enabled = std::getenv("COSIGN_EVENTS_ENABLED"))
            cfg.events.enabled = std::string(enabled) != "0";
        if (const char *level = std::getenv("COSIGN_LOG_LEVEL"))
            cfg.log.level = level;
        if (const char *balance = std::getenv("COSIGN_TREASURY_BALANCE"))
        {
            std::string_view text(balance);
            Amount value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
            {
                return std::unexpected(CosignError::config(
                    "COSIGN_TREASURY_BALANCE is not a non-negative integer: " + std::string(text)));
            }
            cfg.treasury.balance = value;
        }
        return {};
    }

    Result<void> ConfigLoader::check(const CosignConfig &cfg)
    {
        if (std::find(kLogLevels.begin(), kLogLevels.end(), cfg.log.level) == kLogLevels.end())
        {
            return std::unexpected(CosignError::config("Unknown log level: " + cfg.log.level));
        }
        if (cfg.storage.rocksdb_path.empty())
        {
            return std::unexpected(CosignError::config("storage.rocksdb_path must not be empty"));
        }
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const CosignConfig &cfg)
    {
        nlohmann::json j;
        j["ledger"] = {{"owners", cfg.ledger.owners}};
        j["treasury"] = {{"balance", cfg.treasury.balance}};
        j["storage"] = {{"rocksdb_path", cfg.storage.rocksdb_path}};
        j["events"] = {{"enabled", cfg.events.enabled}};
        j["log"] = {{"level", cfg.log.level}};
        return j;
    }

} // namespace cosign
