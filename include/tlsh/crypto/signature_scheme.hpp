#pragma once
#include <cstdint>
#include <string_view>

namespace tlsh::crypto
{

/// https://datatracker.ietf.org/doc/html/rfc5246#section-7.4.1.4.1
/// https://datatracker.ietf.org/doc/html/rfc8446#section-4.2.3

class SignatureScheme final
{
public:
    enum Code : uint16_t
    {
        NONE = 0x0000,

        RSA_PKCS1_SHA1 = 0x0201,
        RSA_PKCS1_SHA256 = 0x0401,
        RSA_PKCS1_SHA384 = 0x0501,
        RSA_PKCS1_SHA512 = 0x0601,

        ECDSA_SHA1 = 0x0203,
        ECDSA_SHA256 = 0x0403,
        ECDSA_SHA384 = 0x0503,
        ECDSA_SHA512 = 0x0603,

        RSA_PSS_RSAE_SHA256 = 0x0804,
        RSA_PSS_RSAE_SHA384 = 0x0805,
        RSA_PSS_RSAE_SHA512 = 0x0806,
    };

public:
    constexpr SignatureScheme()
        : code_(NONE)
    {
    }

    constexpr SignatureScheme(uint16_t wireCode)
        : SignatureScheme(static_cast<Code>(wireCode))
    {
    }

    constexpr SignatureScheme(Code wireCode)
        : code_(wireCode)
    {
    }

    constexpr Code code() const noexcept
    {
        return code_;
    }

    constexpr uint16_t wireCode() const noexcept
    {
        return static_cast<uint16_t>(code_);
    }

    constexpr bool operator==(const SignatureScheme& rhs) const noexcept
    {
        return code_ == rhs.code_;
    }

    constexpr bool operator!=(const SignatureScheme& rhs) const noexcept
    {
        return !(*this == rhs);
    }

    bool isSet() const noexcept;

    /// @brief Checks whether the scheme is one this library can verify.
    bool isSupported() const noexcept;

    bool isPSS() const noexcept;

    std::string_view toString() const noexcept;

    /// @brief Gets the digest name used with the scheme.
    std::string_view getHashAlgorithm() const noexcept;

    /// @brief Gets the OpenSSL key type name ("RSA" or "EC").
    std::string_view getKeyAlgorithm() const noexcept;

private:
    Code code_;
};

} // namespace tlsh::crypto
