#include "cosign/ledger.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace cosign
{

    namespace
    {
        std::unexpected<CosignError> rejected(std::string_view operation, CosignError error)
        {
            spdlog::debug("{} rejected ({}): {}", operation, error_code_to_string(error.code), error.what());
            return std::unexpected(std::move(error));
        }
    } // namespace

    /**
     * Holds the ledger mutex for one public operation. When the outermost
     * scope closes, staged notifications are delivered.
     */
    class AuthorizationLedger::OperationScope
    {
    public:
        explicit OperationScope(AuthorizationLedger &ledger)
            : ledger_(ledger), lock_(ledger.mutex_)
        {
            ++ledger_.depth_;
        }

        ~OperationScope()
        {
            if (--ledger_.depth_ == 0)
            {
                ledger_.flush_events();
            }
        }

        OperationScope(const OperationScope &) = delete;
        OperationScope &operator=(const OperationScope &) = delete;

    private:
        AuthorizationLedger &ledger_;
        std::unique_lock<std::recursive_mutex> lock_;
    };

    AuthorizationLedger::AuthorizationLedger(std::vector<Address> owners,
                                             std::shared_ptr<Treasury> treasury,
                                             std::shared_ptr<EventSink> events)
        : owners_(std::move(owners)),
          treasury_(std::move(treasury)),
          events_(std::move(events))
    {
        owner_slots_.reserve(owners_.size());
        for (std::size_t slot = 0; slot < owners_.size(); ++slot)
        {
            owner_slots_.emplace(owners_[slot], slot);
        }
    }

    Result<std::unique_ptr<AuthorizationLedger>> AuthorizationLedger::create(
        std::vector<Address> owners,
        std::shared_ptr<Treasury> treasury,
        std::shared_ptr<EventSink> events)
    {
        if (auto res = validate_owner_list(owners); !res)
            return std::unexpected(res.error());
        if (!treasury)
            return std::unexpected(CosignError::invalid_state("a treasury is required"));

        spdlog::info("ledger created with {} owners, threshold {}", owners.size(), kConfirmationThreshold);
        return std::unique_ptr<AuthorizationLedger>(
            new AuthorizationLedger(std::move(owners), std::move(treasury), std::move(events)));
    }

    Result<std::unique_ptr<AuthorizationLedger>> AuthorizationLedger::restore(
        const LedgerState &state,
        std::shared_ptr<Treasury> treasury,
        std::shared_ptr<EventSink> events)
    {
        if (auto res = state.validate(); !res)
            return std::unexpected(res.error());
        if (!treasury)
            return std::unexpected(CosignError::invalid_state("a treasury is required"));

        std::unique_ptr<AuthorizationLedger> ledger(
            new AuthorizationLedger(state.owners, std::move(treasury), std::move(events)));

        ledger->log_.records.reserve(state.transactions.size());
        ledger->log_.confirmed.reserve(state.transactions.size());
        for (const auto &entry : state.transactions)
        {
            std::vector<bool> row(ledger->owners_.size(), false);
            for (const auto &owner : entry.confirmed_by)
            {
                row[ledger->owner_slots_.at(owner)] = true;
            }
            ledger->log_.records.push_back(entry.record);
            ledger->log_.confirmed.push_back(std::move(row));
        }

        spdlog::info("ledger restored with {} owners and {} transaction(s)",
                     ledger->owners_.size(), ledger->log_.records.size());
        return ledger;
    }

    Result<TxIndex> AuthorizationLedger::submit(const Address &caller, const Address &destination, Amount amount)
    {
        OperationScope scope(*this);
        if (!owner_slot(caller))
            return rejected("submit", CosignError::not_owner(caller));

        // Read before appending so a failing treasury leaves the log untouched.
        const Amount balance = treasury_->balance();

        TxIndex index = log_.records.size();
        log_.records.push_back(TransactionRecord{caller, destination, amount, false, 0});
        log_.confirmed.emplace_back(owners_.size(), false);

        stage(LedgerEvent::submitted(caller, index, amount, balance));
        spdlog::debug("transaction {} submitted by {}: {} to {}", index, caller, amount, destination);
        return index;
    }

    Result<void> AuthorizationLedger::confirm(const Address &caller, TxIndex index)
    {
        OperationScope scope(*this);
        if (index >= log_.records.size())
            return rejected("confirm", CosignError::tx_not_found(index));

        auto slot = owner_slot(caller);
        if (!slot)
            return rejected("confirm", CosignError::not_owner(caller));
        if (log_.confirmed[index][*slot])
            return rejected("confirm", CosignError::already_confirmed(caller, index));
        if (log_.records[index].executed)
            return rejected("confirm", CosignError::already_executed(index));

        log_.confirmed[index][*slot] = true;
        ++log_.records[index].confirmations;

        stage(LedgerEvent::confirmed(caller, index));
        spdlog::debug("transaction {} confirmed by {} ({} total)", index, caller, log_.records[index].confirmations);
        return {};
    }

    Result<void> AuthorizationLedger::revoke(const Address &caller, TxIndex index)
    {
        OperationScope scope(*this);
        if (index >= log_.records.size())
            return rejected("revoke", CosignError::tx_not_found(index));
        if (log_.records[index].executed)
            return rejected("revoke", CosignError::already_executed(index));

        // Non-owners never hold a confirmation, so they fail here as well.
        auto slot = owner_slot(caller);
        if (!slot || !log_.confirmed[index][*slot])
            return rejected("revoke", CosignError::not_confirmed(caller, index));

        log_.confirmed[index][*slot] = false;
        --log_.records[index].confirmations;

        stage(LedgerEvent::revoked(caller, index));
        spdlog::debug("transaction {} revoked by {} ({} total)", index, caller, log_.records[index].confirmations);
        return {};
    }

    Result<void> AuthorizationLedger::execute(const Address &caller, TxIndex index)
    {
        OperationScope scope(*this);
        if (!owner_slot(caller))
            return rejected("execute", CosignError::not_owner(caller));
        if (index >= log_.records.size())
            return rejected("execute", CosignError::tx_not_found(index));

        const auto &record = log_.records[index];
        if (record.executed)
            return rejected("execute", CosignError::already_executed(index));
        if (record.confirmations < kConfirmationThreshold)
            return rejected("execute", CosignError::insufficient_confirmations(
                                           index, record.confirmations, kConfirmationThreshold));

        // A payout made by a nested execute could not be undone by this
        // call's rollback, so only one transfer may be in flight.
        if (transfer_in_flight_)
            return rejected("execute", CosignError::invalid_state(
                                           "transaction " + std::to_string(index) +
                                           " cannot execute while another transfer is in flight"));

        const Address destination = record.destination;
        const Amount amount = record.amount;

        // The treasury may call back into this ledger. Anything done before it
        // returns is part of this operation and is undone with it.
        Log saved = log_;
        const auto staged_mark = staged_.size();
        log_.records[index].executed = true;

        bool transferred = false;
        transfer_in_flight_ = true;
        try
        {
            transferred = treasury_->transfer(destination, amount);
        }
        catch (...)
        {
            transfer_in_flight_ = false;
            log_ = std::move(saved);
            staged_.erase(staged_.begin() + static_cast<std::ptrdiff_t>(staged_mark), staged_.end());
            spdlog::warn("transaction {} rolled back: treasury threw during transfer", index);
            throw;
        }

        transfer_in_flight_ = false;

        if (!transferred)
        {
            log_ = std::move(saved);
            staged_.erase(staged_.begin() + static_cast<std::ptrdiff_t>(staged_mark), staged_.end());
            spdlog::warn("transaction {} rolled back: transfer of {} to {} declined", index, amount, destination);
            return std::unexpected(CosignError::transfer_failed(index));
        }

        stage(LedgerEvent::executed(caller, index));
        spdlog::info("transaction {} executed by {}: {} to {}", index, caller, amount, destination);
        return {};
    }

    std::vector<Address> AuthorizationLedger::owners() const
    {
        return owners_;
    }

    bool AuthorizationLedger::is_owner(const Address &identity) const
    {
        return owner_slots_.contains(identity);
    }

    std::size_t AuthorizationLedger::transaction_count() const
    {
        std::lock_guard lock(mutex_);
        return log_.records.size();
    }

    Result<TransactionRecord> AuthorizationLedger::transaction(TxIndex index) const
    {
        std::lock_guard lock(mutex_);
        if (index >= log_.records.size())
            return std::unexpected(CosignError::tx_not_found(index));
        return log_.records[index];
    }

    bool AuthorizationLedger::is_confirmed(TxIndex index, const Address &owner) const
    {
        std::lock_guard lock(mutex_);
        auto slot = owner_slot(owner);
        if (!slot || index >= log_.confirmed.size())
            return false;
        return log_.confirmed[index][*slot];
    }

    Result<std::vector<Address>> AuthorizationLedger::confirmations(TxIndex index) const
    {
        std::lock_guard lock(mutex_);
        if (index >= log_.confirmed.size())
            return std::unexpected(CosignError::tx_not_found(index));

        std::vector<Address> out;
        for (std::size_t slot = 0; slot < owners_.size(); ++slot)
        {
            if (log_.confirmed[index][slot])
                out.push_back(owners_[slot]);
        }
        return out;
    }

    LedgerState AuthorizationLedger::snapshot() const
    {
        std::lock_guard lock(mutex_);
        LedgerState state;
        state.owners = owners_;
        state.threshold = kConfirmationThreshold;
        state.transactions.reserve(log_.records.size());
        for (std::size_t i = 0; i < log_.records.size(); ++i)
        {
            TransactionEntry entry{log_.records[i], {}};
            for (std::size_t slot = 0; slot < owners_.size(); ++slot)
            {
                if (log_.confirmed[i][slot])
                    entry.confirmed_by.push_back(owners_[slot]);
            }
            state.transactions.push_back(std::move(entry));
        }
        return state;
    }

    std::optional<std::size_t> AuthorizationLedger::owner_slot(const Address &identity) const
    {
        auto it = owner_slots_.find(identity);
        if (it == owner_slots_.end())
            return std::nullopt;
        return it->second;
    }

    void AuthorizationLedger::stage(LedgerEvent event)
    {
        staged_.push_back(std::move(event));
    }

    void AuthorizationLedger::flush_events()
    {
        auto pending = std::move(staged_);
        staged_.clear();
        if (!events_)
            return;

        for (const auto &event : pending)
        {
            try
            {
                events_->publish(event);
            }
            catch (const std::exception &e)
            {
                spdlog::error("event sink failed on {} for transaction {}: {}",
                              event_kind_to_string(event.kind), event.index, e.what());
            }
            catch (...)
            {
                // Runs from a destructor; nothing may escape.
                spdlog::error("event sink failed on {} for transaction {}: unknown exception",
                              event_kind_to_string(event.kind), event.index);
            }
        }
    }

} // namespace cosign
