#include "cosign/ledger_store.hpp"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <stdexcept>
#include <string>

namespace cosign
{

    namespace
    {
        constexpr const char *kStateKey = "ledger/state";
        constexpr const char *kBalanceKey = "treasury/balance";
    } // namespace

    class RocksDbLedgerStore::Impl
    {
    public:
        explicit Impl(const std::string &path)
        {
            rocksdb::Options options;
            options.create_if_missing = true;
            auto status = rocksdb::DB::Open(options, path, &db);
            if (!status.ok())
            {
                throw std::runtime_error("RocksDB open failed: " + status.ToString());
            }
            spdlog::debug("opened ledger store at {}", path);
        }

        ~Impl()
        {
            delete db;
        }

        Result<std::optional<std::string>> get(const std::string &key)
        {
            std::string value;
            auto status = db->Get(rocksdb::ReadOptions(), key, &value);
            if (status.IsNotFound())
                return std::optional<std::string>{};
            if (!status.ok())
            {
                return std::unexpected(CosignError::storage("RocksDB Get failed: " + status.ToString()));
            }
            return std::optional<std::string>(std::move(value));
        }

        Result<void> write(rocksdb::WriteBatch &batch)
        {
            rocksdb::WriteOptions options;
            options.sync = true;
            auto status = db->Write(options, &batch);
            if (!status.ok())
            {
                return std::unexpected(CosignError::storage("RocksDB Write failed: " + status.ToString()));
            }
            return {};
        }

    private:
        rocksdb::DB *db{nullptr};
    };

    RocksDbLedgerStore::RocksDbLedgerStore(const std::string &path) : impl_(std::make_unique<Impl>(path)) {}
    RocksDbLedgerStore::~RocksDbLedgerStore() = default;

    Result<std::optional<LedgerState>> RocksDbLedgerStore::load_state()
    {
        auto raw = impl_->get(kStateKey);
        if (!raw)
            return std::unexpected(raw.error());
        if (!*raw)
            return std::optional<LedgerState>{};

        auto state = LedgerState::parse(**raw);
        if (!state)
            return std::unexpected(state.error());
        return std::optional<LedgerState>(std::move(*state));
    }

    Result<std::optional<Amount>> RocksDbLedgerStore::load_balance()
    {
        auto raw = impl_->get(kBalanceKey);
        if (!raw)
            return std::unexpected(raw.error());
        if (!*raw)
            return std::optional<Amount>{};

        const auto &text = **raw;
        Amount balance = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), balance);
        if (ec != std::errc{} || ptr != text.data() + text.size())
        {
            return std::unexpected(CosignError::parsing("Stored treasury balance is not a number: " + text));
        }
        return std::optional<Amount>(balance);
    }

    Result<void> RocksDbLedgerStore::save(const LedgerState &state, Amount balance)
    {
        rocksdb::WriteBatch batch;
        auto status = batch.Put(kStateKey, state.to_json().dump());
        if (status.ok())
            status = batch.Put(kBalanceKey, std::to_string(balance));
        if (!status.ok())
        {
            return std::unexpected(CosignError::storage("RocksDB batch failed: " + status.ToString()));
        }
        return impl_->write(batch);
    }

} // namespace cosign
