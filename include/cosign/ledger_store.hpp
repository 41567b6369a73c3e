#pragma once

#include "ledger_state.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace cosign
{

    /**
     * Abstract interface for durable ledger storage.
     * Holds one ledger state and the balance of the treasury backing it.
     */
    class LedgerStore
    {
    public:
        virtual ~LedgerStore() = default;

        /** Persisted state, or nullopt when no ledger has been saved yet */
        virtual Result<std::optional<LedgerState>> load_state() = 0;

        virtual Result<std::optional<Amount>> load_balance() = 0;

        /** Commit state and treasury balance together; neither is written alone */
        virtual Result<void> save(const LedgerState &state, Amount balance) = 0;
    };

    /**
     * RocksDB-backed LedgerStore. State is stored as JSON under a fixed key.
     * The constructor throws std::runtime_error if the database cannot be
     * opened.
     */
    class RocksDbLedgerStore : public LedgerStore
    {
    public:
        explicit RocksDbLedgerStore(const std::string &path);
        ~RocksDbLedgerStore() override;

        Result<std::optional<LedgerState>> load_state() override;
        Result<std::optional<Amount>> load_balance() override;
        Result<void> save(const LedgerState &state, Amount balance) override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace cosign
