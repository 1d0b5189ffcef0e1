#pragma once
#include <cstdint>
#include <vector>
#include <casket/nonstd/span.hpp>
#include <tlsh/crypto/pointers.hpp>

namespace tlsh::crypto
{

/// @brief Named groups for ephemeral elliptic curve key agreement (RFC 8422).
class GroupParams final
{
public:
    enum Code : uint16_t
    {
        NONE = 0,

        SECP256R1 = 23,
        SECP384R1 = 24,
        SECP521R1 = 25,

        X25519 = 29,
    };

    constexpr GroupParams()
        : code_(Code::NONE)
    {
    }

    constexpr GroupParams(GroupParams::Code code)
        : code_(code)
    {
    }

    constexpr GroupParams(uint16_t code)
        : code_(static_cast<GroupParams::Code>(code))
    {
    }

    const char* toString() const;

    constexpr bool operator==(GroupParams other) const
    {
        return code_ == other.code_;
    }

    constexpr bool operator!=(GroupParams other) const
    {
        return code_ != other.code_;
    }

    constexpr GroupParams::Code code() const
    {
        return code_;
    }

    constexpr uint16_t wireCode() const
    {
        return static_cast<uint16_t>(code_);
    }

    constexpr bool isX25519() const
    {
        return code_ == GroupParams::Code::X25519;
    }

    constexpr bool isEcdhNamedCurve() const
    {
        return code_ == GroupParams::Code::SECP256R1 || code_ == GroupParams::Code::SECP384R1 ||
               code_ == GroupParams::Code::SECP521R1;
    }

    constexpr bool isSupported() const
    {
        return isX25519() || isEcdhNamedCurve();
    }

    static const std::vector<GroupParams>& getSupported();

    static KeyPtr generateKeyByParams(const GroupParams groupParams);

    /// @brief Builds a public key from its encoded form (an uncompressed point or a raw X25519 value).
    static KeyPtr decodePublicKey(const GroupParams groupParams, nonstd::span<const uint8_t> encoded);

    static std::vector<uint8_t> deriveSecret(Key* privateKey, Key* publicKey);

private:
    Code code_;
};

} // namespace tlsh::crypto
