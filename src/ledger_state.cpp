#include "cosign/ledger_state.hpp"
#include <algorithm>
#include <format>
#include <unordered_set>

using Json = nlohmann::json;

namespace cosign
{

    Result<void> validate_owner_list(const std::vector<Address> &owners)
    {
        if (owners.size() <= kMinOwnerCountExclusive)
        {
            return std::unexpected(CosignError::invalid_owner_count(owners.size()));
        }

        std::unordered_set<Address> seen;
        for (const auto &owner : owners)
        {
            if (!seen.insert(owner).second)
            {
                return std::unexpected(CosignError::duplicate_owner(owner));
            }
        }
        return {};
    }

    Json TransactionRecord::to_json() const
    {
        return Json{
            {"proposer", proposer},
            {"destination", destination},
            {"amount", amount},
            {"executed", executed},
            {"confirmations", confirmations}};
    }

    Json LedgerState::to_json() const
    {
        Json txs = Json::array();
        for (const auto &entry : transactions)
        {
            Json tx = entry.record.to_json();
            tx["confirmed_by"] = entry.confirmed_by;
            txs.push_back(std::move(tx));
        }

        return Json{
            {"owners", owners},
            {"threshold", threshold},
            {"transactions", std::move(txs)}};
    }

    Result<LedgerState> LedgerState::from_json(const Json &j)
    {
        try
        {
            LedgerState state;
            state.owners = j.at("owners").get<std::vector<Address>>();
            state.threshold = j.at("threshold").get<std::size_t>();

            for (const auto &tx : j.at("transactions"))
            {
                const auto &amount = tx.at("amount");
                if (!amount.is_number_unsigned())
                {
                    return std::unexpected(CosignError::parsing(
                        std::format("transaction {}: amount must be a non-negative integer", state.transactions.size())));
                }

                TransactionEntry entry;
                entry.record.proposer = tx.at("proposer").get<Address>();
                entry.record.destination = tx.at("destination").get<Address>();
                entry.record.amount = amount.get<Amount>();
                entry.record.executed = tx.at("executed").get<bool>();
                entry.record.confirmations = tx.at("confirmations").get<std::size_t>();
                entry.confirmed_by = tx.value("confirmed_by", std::vector<Address>{});
                state.transactions.push_back(std::move(entry));
            }
            return state;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(CosignError::parsing(std::string("Malformed ledger state: ") + e.what()));
        }
    }

    Result<LedgerState> LedgerState::parse(const std::string &text)
    {
        Json j;
        try
        {
            j = Json::parse(text);
        }
        catch (const Json::parse_error &e)
        {
            return std::unexpected(CosignError::parsing(std::string("Invalid ledger state JSON: ") + e.what()));
        }
        return from_json(j);
    }

    Result<void> LedgerState::validate() const
    {
        if (auto res = validate_owner_list(owners); !res)
            return res;

        if (threshold != kConfirmationThreshold)
        {
            return std::unexpected(CosignError::invalid_state(
                std::format("threshold must be {}, got {}", kConfirmationThreshold, threshold)));
        }

        std::unordered_set<Address> owner_set(owners.begin(), owners.end());
        for (std::size_t i = 0; i < transactions.size(); ++i)
        {
            const auto &entry = transactions[i];
            if (!owner_set.contains(entry.record.proposer))
            {
                return std::unexpected(CosignError::invalid_state(
                    std::format("transaction {}: proposer {} is not an owner", i, entry.record.proposer)));
            }

            std::unordered_set<Address> confirmers;
            for (const auto &owner : entry.confirmed_by)
            {
                if (!owner_set.contains(owner))
                {
                    return std::unexpected(CosignError::invalid_state(
                        std::format("transaction {}: confirmer {} is not an owner", i, owner)));
                }
                if (!confirmers.insert(owner).second)
                {
                    return std::unexpected(CosignError::invalid_state(
                        std::format("transaction {}: {} confirmed twice", i, owner)));
                }
            }

            if (entry.record.confirmations != entry.confirmed_by.size())
            {
                return std::unexpected(CosignError::invalid_state(
                    std::format("transaction {}: count {} does not match {} confirmer(s)",
                                i, entry.record.confirmations, entry.confirmed_by.size())));
            }

            if (entry.record.executed && entry.record.confirmations < threshold)
            {
                return std::unexpected(CosignError::invalid_state(
                    std::format("transaction {}: executed below threshold", i)));
            }
        }
        return {};
    }

} // namespace cosign
