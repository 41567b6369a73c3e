#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace cosign::crypto
{

    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        /**
         * Compute SHA-256 hash of data
         */
        static SHA256Hash hash(const Bytes &data);

        /**
         * Compute SHA-256 hash of string
         */
        static SHA256Hash hash(const std::string &data);

        /**
         * Convert hash to hex string
         */
        static std::string to_hex(const SHA256Hash &hash);

        /**
         * Parse hash from hex string
         */
        static Result<SHA256Hash> from_hex(const std::string &hex);
    };

} // namespace cosign::crypto
