#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cosign
{

    enum class EventKind
    {
        Submitted,
        Confirmed,
        Revoked,
        Executed
    };

    std::string event_kind_to_string(EventKind kind);

    /**
     * Notification emitted after a ledger mutation commits.
     * amount and balance are only set on Submitted.
     */
    struct LedgerEvent
    {
        EventKind kind{EventKind::Submitted};
        Address actor;
        TxIndex index{0};
        std::optional<Amount> amount;
        std::optional<Amount> balance;

        nlohmann::json to_json() const;

        static LedgerEvent submitted(Address actor, TxIndex index, Amount amount, Amount balance);
        static LedgerEvent confirmed(Address actor, TxIndex index);
        static LedgerEvent revoked(Address actor, TxIndex index);
        static LedgerEvent executed(Address actor, TxIndex index);
    };

    /** Receiver of ledger notifications. Delivery is fire-and-forget. */
    class EventSink
    {
    public:
        virtual ~EventSink() = default;

        virtual void publish(const LedgerEvent &event) = 0;
    };

    struct JournalEntry
    {
        std::uint64_t sequence{0};
        std::string ts;
        LedgerEvent event;
        std::string previous_hash;
        std::string hash;

        nlohmann::json to_json() const;
    };

    /**
     * EventJournal links notifications with hashes for tamper detection. Each
     * entry hash is SHA-256 over the previous head and the canonical JSON of
     * the event. Entries are written to the spdlog default logger as JSON.
     */
    class EventJournal : public EventSink
    {
    public:
        explicit EventJournal(bool log_entries = true);

        void publish(const LedgerEvent &event) override;

        /** Last hash in the chain */
        std::optional<std::string> head() const;

        std::vector<JournalEntry> entries() const;

        /** Recompute the chain and check every link */
        bool verify() const;

        /** Recompute the chain over an arbitrary entry list */
        static bool verify(const std::vector<JournalEntry> &entries);

        static std::string chain_hash(const std::string &previous_hash, const LedgerEvent &event);

    private:
        bool log_entries_;
        mutable std::mutex mutex_;
        std::vector<JournalEntry> entries_;
    };

} // namespace cosign
