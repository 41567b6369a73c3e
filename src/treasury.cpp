#include "cosign/treasury.hpp"
#include <spdlog/spdlog.h>
#include <limits>
#include <string>

namespace cosign
{

    InMemoryTreasury::InMemoryTreasury() = default;

    InMemoryTreasury::InMemoryTreasury(Amount initial_balance) : balance_(initial_balance) {}

    Amount InMemoryTreasury::balance() const
    {
        std::lock_guard lock(mutex_);
        return balance_;
    }

    bool InMemoryTreasury::transfer(const Address &destination, Amount amount)
    {
        std::lock_guard lock(mutex_);
        if (rejected_.contains(destination))
        {
            spdlog::warn("treasury: destination {} rejected transfer of {}", destination, amount);
            return false;
        }
        if (amount > balance_)
        {
            spdlog::warn("treasury: transfer of {} exceeds balance {}", amount, balance_);
            return false;
        }
        balance_ -= amount;
        payouts_.push_back(Payout{destination, amount});
        return true;
    }

    Result<void> InMemoryTreasury::deposit(Amount amount)
    {
        std::lock_guard lock(mutex_);
        if (amount > std::numeric_limits<Amount>::max() - balance_)
        {
            spdlog::warn("treasury: deposit of {} would overflow balance {}", amount, balance_);
            return std::unexpected(CosignError::invalid_state(
                "deposit of " + std::to_string(amount) + " would overflow the treasury balance"));
        }
        balance_ += amount;
        return {};
    }

    void InMemoryTreasury::reject_destination(const Address &destination)
    {
        std::lock_guard lock(mutex_);
        rejected_.insert(destination);
    }

    void InMemoryTreasury::accept_destination(const Address &destination)
    {
        std::lock_guard lock(mutex_);
        rejected_.erase(destination);
    }

    std::vector<InMemoryTreasury::Payout> InMemoryTreasury::payouts() const
    {
        std::lock_guard lock(mutex_);
        return payouts_;
    }

} // namespace cosign
