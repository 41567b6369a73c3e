#include "cosign/crypto.hpp"
#include <sodium.h>
#include <format>

namespace cosign::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(const std::string &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        std::string hex(hash.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), hash.data(), hash.size());
        hex.pop_back();
        return hex;
    }

    Result<SHA256Hash> SHA256::from_hex(const std::string &hex)
    {
        if (hex.size() != 64)
        {
            return std::unexpected(CosignError::parsing("Invalid SHA-256 hex length"));
        }

        SHA256Hash hash;
        std::size_t decoded = 0;
        if (sodium_hex2bin(hash.data(), hash.size(), hex.data(), hex.size(), nullptr, &decoded, nullptr) != 0 ||
            decoded != hash.size())
        {
            return std::unexpected(CosignError::parsing(std::format("Invalid hex digest: {}", hex)));
        }
        return hash;
    }

} // namespace cosign::crypto
