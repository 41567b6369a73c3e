#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cosign
{

    /** Authenticated participant or destination identity */
    using Address = std::string;

    /** Value moved by a transfer, in the treasury's smallest unit */
    using Amount = std::uint64_t;

    /** Position of a transaction in the ledger's log */
    using TxIndex = std::size_t;

    /**
     * Error kinds reported by cosign operations.
     * The first block is the ledger taxonomy; the rest covers the surrounding
     * tooling (state restore, config, storage).
     */
    enum class ErrorCode
    {
        NotOwner,
        TxNotFound,
        AlreadyConfirmed,
        NotConfirmed,
        AlreadyExecuted,
        InsufficientConfirmations,
        TransferFailed,
        InvalidOwnerCount,
        DuplicateOwner,

        InvalidState,
        ConfigError,
        ParsingError,
        StorageError,
        IOError
    };

    /**
     * Convert ErrorCode to its stable name
     */
    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::NotOwner:
            return "NotOwner";
        case ErrorCode::TxNotFound:
            return "TxNotFound";
        case ErrorCode::AlreadyConfirmed:
            return "AlreadyConfirmed";
        case ErrorCode::NotConfirmed:
            return "NotConfirmed";
        case ErrorCode::AlreadyExecuted:
            return "AlreadyExecuted";
        case ErrorCode::InsufficientConfirmations:
            return "InsufficientConfirmations";
        case ErrorCode::TransferFailed:
            return "TransferFailed";
        case ErrorCode::InvalidOwnerCount:
            return "InvalidOwnerCount";
        case ErrorCode::DuplicateOwner:
            return "DuplicateOwner";
        case ErrorCode::InvalidState:
            return "InvalidState";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::ParsingError:
            return "ParsingError";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::IOError:
            return "IOError";
        }
        return "Unknown";
    }

    /**
     * cosign error with code and message
     */
    class CosignError : public std::runtime_error
    {
    public:
        ErrorCode code;

        CosignError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static CosignError not_owner(std::string_view caller)
        {
            return CosignError(ErrorCode::NotOwner, std::format("{} is not an owner", caller));
        }

        static CosignError tx_not_found(TxIndex index)
        {
            return CosignError(ErrorCode::TxNotFound, std::format("transaction {} does not exist", index));
        }

        static CosignError already_confirmed(std::string_view caller, TxIndex index)
        {
            return CosignError(ErrorCode::AlreadyConfirmed,
                               std::format("{} already confirmed transaction {}", caller, index));
        }

        static CosignError not_confirmed(std::string_view caller, TxIndex index)
        {
            return CosignError(ErrorCode::NotConfirmed,
                               std::format("{} has no confirmation on transaction {}", caller, index));
        }

        static CosignError already_executed(TxIndex index)
        {
            return CosignError(ErrorCode::AlreadyExecuted, std::format("transaction {} already executed", index));
        }

        static CosignError insufficient_confirmations(TxIndex index, std::size_t have, std::size_t need)
        {
            return CosignError(ErrorCode::InsufficientConfirmations,
                               std::format("transaction {} has {} of {} required confirmations", index, have, need));
        }

        static CosignError transfer_failed(TxIndex index)
        {
            return CosignError(ErrorCode::TransferFailed, std::format("transfer for transaction {} failed", index));
        }

        static CosignError invalid_owner_count(std::size_t count)
        {
            return CosignError(ErrorCode::InvalidOwnerCount,
                               std::format("owner list must have more than 3 entries, got {}", count));
        }

        static CosignError duplicate_owner(std::string_view owner)
        {
            return CosignError(ErrorCode::DuplicateOwner, std::format("owner {} listed more than once", owner));
        }

        static CosignError invalid_state(const std::string &msg)
        {
            return CosignError(ErrorCode::InvalidState, msg);
        }

        static CosignError config(const std::string &msg)
        {
            return CosignError(ErrorCode::ConfigError, msg);
        }

        static CosignError parsing(const std::string &msg)
        {
            return CosignError(ErrorCode::ParsingError, msg);
        }

        static CosignError storage(const std::string &msg)
        {
            return CosignError(ErrorCode::StorageError, msg);
        }

        static CosignError io(const std::string &msg)
        {
            return CosignError(ErrorCode::IOError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, CosignError>;

} // namespace cosign
