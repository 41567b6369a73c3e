#pragma once

#include "types.hpp"
#include <mutex>
#include <unordered_set>
#include <utility>
#include <vector>

namespace cosign
{

    /**
     * Transfer capability supplied by the hosting environment.
     * The ledger calls transfer() only from execute and reads balance() for
     * submission notifications.
     */
    class Treasury
    {
    public:
        virtual ~Treasury() = default;

        /** Value currently held */
        virtual Amount balance() const = 0;

        /**
         * Move amount to destination.
         * @return false when the environment declines the transfer
         */
        virtual bool transfer(const Address &destination, Amount amount) = 0;
    };

    /**
     * Process-local treasury. Declines transfers that exceed the balance or
     * target a rejected destination.
     */
    class InMemoryTreasury : public Treasury
    {
    public:
        struct Payout
        {
            Address destination;
            Amount amount;
        };

        InMemoryTreasury();
        explicit InMemoryTreasury(Amount initial_balance);

        Amount balance() const override;
        bool transfer(const Address &destination, Amount amount) override;

        /** Fails with InvalidState when the balance would overflow */
        Result<void> deposit(Amount amount);

        /** Mark a destination as unable to receive transfers */
        void reject_destination(const Address &destination);

        /** Allow a previously rejected destination again */
        void accept_destination(const Address &destination);

        std::vector<Payout> payouts() const;

    private:
        mutable std::mutex mutex_;
        Amount balance_{0};
        std::unordered_set<Address> rejected_;
        std::vector<Payout> payouts_;
    };

} // namespace cosign
