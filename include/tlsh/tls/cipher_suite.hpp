#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tlsh::tls
{

enum class KeyExchange : uint8_t
{
    RSA,
    ECDHE,
};

enum class Authentication : uint8_t
{
    RSA,
    ECDSA,
};

enum class CipherMode : uint8_t
{
    CBC,
    AEAD,
};

/// @brief Capabilities of a TLSv1.2 cipher suite.
///
/// Lengths are in bytes. For AEAD suites the MAC fields are empty and the
/// fixed IV is the implicit part of the nonce taken from the key block.
struct CipherSuite
{
    uint16_t id;
    std::string_view name;
    KeyExchange kx;
    Authentication auth;
    CipherMode mode;
    std::string_view cipher;
    size_t keyLength;
    size_t fixedIvLength;
    size_t recordIvLength;
    std::string_view macDigest;
    size_t macLength;
    size_t tagLength;
    std::string_view prfDigest;

    inline bool isAEAD() const noexcept
    {
        return mode == CipherMode::AEAD;
    }

    inline bool isEphemeral() const noexcept
    {
        return kx == KeyExchange::ECDHE;
    }

    /// @brief Total length of the key block: MAC keys, write keys, IVs.
    inline size_t keyBlockLength() const noexcept
    {
        return 2 * (macLength + keyLength + fixedIvLength);
    }
};

} // namespace tlsh::tls
