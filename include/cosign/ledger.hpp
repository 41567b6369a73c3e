#pragma once

#include "events.hpp"
#include "ledger_state.hpp"
#include "treasury.hpp"
#include "types.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace cosign
{

    /**
     * M-of-N authorization ledger for outbound transfers.
     *
     * A fixed owner set proposes transfers (submit), approves them (confirm),
     * withdraws approvals (revoke) and, once kConfirmationThreshold distinct
     * owners approve, performs them through the Treasury (execute). Every
     * operation is all-or-nothing: a failure leaves the ledger exactly as it
     * was before the call.
     *
     * One recursive mutex spans each public operation, including the treasury
     * call made by execute, so the treasury may call back in on the same
     * thread. Notifications are delivered to the EventSink only
     * after the outermost operation commits.
     */
    class AuthorizationLedger
    {
    public:
        /**
         * Build a ledger with an empty log.
         * Fails with InvalidOwnerCount for 3 or fewer owners and DuplicateOwner
         * when an identity repeats.
         */
        static Result<std::unique_ptr<AuthorizationLedger>> create(
            std::vector<Address> owners,
            std::shared_ptr<Treasury> treasury,
            std::shared_ptr<EventSink> events = nullptr);

        /** Rebuild a ledger from persisted state after validating it */
        static Result<std::unique_ptr<AuthorizationLedger>> restore(
            const LedgerState &state,
            std::shared_ptr<Treasury> treasury,
            std::shared_ptr<EventSink> events = nullptr);

        AuthorizationLedger(const AuthorizationLedger &) = delete;
        AuthorizationLedger &operator=(const AuthorizationLedger &) = delete;

        /** Propose a transfer; returns the new transaction index */
        Result<TxIndex> submit(const Address &caller, const Address &destination, Amount amount);

        Result<void> confirm(const Address &caller, TxIndex index);

        Result<void> revoke(const Address &caller, TxIndex index);

        /**
         * Mark the transaction executed and perform the transfer. A declined
         * transfer rolls back everything done during the call and reports
         * TransferFailed; the call may be retried. A nested execute issued by
         * the treasury during a transfer fails with InvalidState.
         */
        Result<void> execute(const Address &caller, TxIndex index);

        std::vector<Address> owners() const;
        bool is_owner(const Address &identity) const;
        std::size_t threshold() const { return kConfirmationThreshold; }
        std::size_t transaction_count() const;
        Result<TransactionRecord> transaction(TxIndex index) const;

        /** False for unknown transactions or identities */
        bool is_confirmed(TxIndex index, const Address &owner) const;

        /** Owners with an outstanding confirmation, in owner-list order */
        Result<std::vector<Address>> confirmations(TxIndex index) const;

        LedgerState snapshot() const;

    private:
        class OperationScope;

        // Transaction records and the confirmation matrix, indexed by
        // transaction then by owner slot.
        struct Log
        {
            std::vector<TransactionRecord> records;
            std::vector<std::vector<bool>> confirmed;
        };

        AuthorizationLedger(std::vector<Address> owners,
                            std::shared_ptr<Treasury> treasury,
                            std::shared_ptr<EventSink> events);

        std::optional<std::size_t> owner_slot(const Address &identity) const;
        void stage(LedgerEvent event);
        void flush_events();

        std::vector<Address> owners_;
        std::unordered_map<Address, std::size_t> owner_slots_;
        std::shared_ptr<Treasury> treasury_;
        std::shared_ptr<EventSink> events_;

        mutable std::recursive_mutex mutex_;
        Log log_;
        std::vector<LedgerEvent> staged_;
        std::size_t depth_{0};
        bool transfer_in_flight_{false};
    };

} // namespace cosign
