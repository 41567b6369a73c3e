#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cosign
{

    struct LedgerConfig
    {
        std::vector<Address> owners;
    };

    struct TreasuryConfig
    {
        Amount balance{0};
    };

    struct StorageConfig
    {
        std::string rocksdb_path{"./data/ledger"};
    };

    struct EventsConfig
    {
        bool enabled{true};
    };

    struct LogConfig
    {
        std::string level{"info"};
    };

    struct CosignConfig
    {
        LedgerConfig ledger{};
        TreasuryConfig treasury{};
        StorageConfig storage{};
        EventsConfig events{};
        LogConfig log{};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides
     * (COSIGN_OWNERS, COSIGN_TREASURY_BALANCE, COSIGN_ROCKSDB_PATH,
     * COSIGN_EVENTS_ENABLED, COSIGN_LOG_LEVEL).
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<CosignConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<CosignConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment overrides, for runs without a config file. */
        static Result<CosignConfig> from_env();

        /** Serialize config to JSON for inspection. */
        static nlohmann::json to_json(const CosignConfig &cfg);

    private:
        static Result<void> apply_env_overrides(CosignConfig &cfg);
        static Result<void> check(const CosignConfig &cfg);
    };

} // namespace cosign
