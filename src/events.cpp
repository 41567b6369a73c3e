#include "cosign/events.hpp"
#include "cosign/crypto.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <ctime>
#include <format>
#include <utility>

namespace cosign
{

    namespace
    {
        std::string now_ts()
        {
            auto now = std::chrono::system_clock::now();
            auto t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
            std::tm tm_buf;
            gmtime_r(&t, &tm_buf);
            return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                               tm_buf.tm_year + 1900,
                               tm_buf.tm_mon + 1,
                               tm_buf.tm_mday,
                               tm_buf.tm_hour,
                               tm_buf.tm_min,
                               tm_buf.tm_sec,
                               static_cast<int>(ms.count()));
        }
    } // namespace

    std::string event_kind_to_string(EventKind kind)
    {
        switch (kind)
        {
        case EventKind::Submitted:
            return "Submitted";
        case EventKind::Confirmed:
            return "Confirmed";
        case EventKind::Revoked:
            return "Revoked";
        case EventKind::Executed:
            return "Executed";
        }
        return "Unknown";
    }

    nlohmann::json LedgerEvent::to_json() const
    {
        nlohmann::json j{{"kind", event_kind_to_string(kind)},
                         {"actor", actor},
                         {"index", index}};
        if (amount)
            j["amount"] = *amount;
        if (balance)
            j["balance"] = *balance;
        return j;
    }

    LedgerEvent LedgerEvent::submitted(Address actor, TxIndex index, Amount amount, Amount balance)
    {
        return LedgerEvent{EventKind::Submitted, std::move(actor), index, amount, balance};
    }

    LedgerEvent LedgerEvent::confirmed(Address actor, TxIndex index)
    {
        return LedgerEvent{EventKind::Confirmed, std::move(actor), index, std::nullopt, std::nullopt};
    }

    LedgerEvent LedgerEvent::revoked(Address actor, TxIndex index)
    {
        return LedgerEvent{EventKind::Revoked, std::move(actor), index, std::nullopt, std::nullopt};
    }

    LedgerEvent LedgerEvent::executed(Address actor, TxIndex index)
    {
        return LedgerEvent{EventKind::Executed, std::move(actor), index, std::nullopt, std::nullopt};
    }

    nlohmann::json JournalEntry::to_json() const
    {
        return nlohmann::json{{"sequence", sequence},
                              {"ts", ts},
                              {"event", event.to_json()},
                              {"previous_hash", previous_hash},
                              {"hash", hash}};
    }

    EventJournal::EventJournal(bool log_entries) : log_entries_(log_entries) {}

    std::string EventJournal::chain_hash(const std::string &previous_hash, const LedgerEvent &event)
    {
        auto material = previous_hash + event.to_json().dump();
        return crypto::SHA256::to_hex(crypto::SHA256::hash(material));
    }

    void EventJournal::publish(const LedgerEvent &event)
    {
        JournalEntry entry;
        {
            std::lock_guard lock(mutex_);
            entry.sequence = entries_.size();
            entry.ts = now_ts();
            entry.event = event;
            entry.previous_hash = entries_.empty() ? std::string{} : entries_.back().hash;
            entry.hash = chain_hash(entry.previous_hash, event);
            entries_.push_back(entry);
        }

        if (log_entries_)
        {
            spdlog::info(entry.to_json().dump());
        }
    }

    std::optional<std::string> EventJournal::head() const
    {
        std::lock_guard lock(mutex_);
        if (entries_.empty())
            return std::nullopt;
        return entries_.back().hash;
    }

    std::vector<JournalEntry> EventJournal::entries() const
    {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    bool EventJournal::verify() const
    {
        std::lock_guard lock(mutex_);
        return verify(entries_);
    }

    bool EventJournal::verify(const std::vector<JournalEntry> &entries)
    {
        std::string previous;
        for (std::size_t i = 0; i < entries.size(); ++i)
        {
            const auto &entry = entries[i];
            if (entry.sequence != i || entry.previous_hash != previous)
                return false;
            if (entry.hash != chain_hash(previous, entry.event))
                return false;
            previous = entry.hash;
        }
        return true;
    }

} // namespace cosign
