#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <vector>

namespace cosign
{

    /** Confirmations required before a transaction may execute */
    inline constexpr std::size_t kConfirmationThreshold = 2;

    /** Owner lists must be strictly longer than this */
    inline constexpr std::size_t kMinOwnerCountExclusive = 3;

    /**
     * One proposed outbound transfer.
     */
    struct TransactionRecord
    {
        Address proposer;
        Address destination;
        Amount amount{0};
        bool executed{false};
        std::size_t confirmations{0};

        bool operator==(const TransactionRecord &) const = default;

        nlohmann::json to_json() const;
    };

    /**
     * A transaction together with the owners holding an outstanding
     * confirmation on it, in owner-list order.
     */
    struct TransactionEntry
    {
        TransactionRecord record;
        std::vector<Address> confirmed_by;

        bool operator==(const TransactionEntry &) const = default;
    };

    /**
     * Everything the ledger persists: owner set, threshold and the log with
     * its confirmation matrix.
     */
    struct LedgerState
    {
        std::vector<Address> owners;
        std::size_t threshold{kConfirmationThreshold};
        std::vector<TransactionEntry> transactions;

        bool operator==(const LedgerState &) const = default;

        nlohmann::json to_json() const;
        static Result<LedgerState> from_json(const nlohmann::json &j);
        static Result<LedgerState> parse(const std::string &text);

        /**
         * Check owner rules, the fixed threshold, that every confirmer is an
         * owner listed once, and that stored counts match the confirmers.
         */
        Result<void> validate() const;
    };

    /** Reject owner lists of 3 or fewer entries or with a repeated identity */
    Result<void> validate_owner_list(const std::vector<Address> &owners);

} // namespace cosign
