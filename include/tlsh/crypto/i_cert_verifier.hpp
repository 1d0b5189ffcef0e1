#pragma once
#include <string_view>
#include <system_error>
#include <tlsh/crypto/typedefs.hpp>

namespace tlsh::crypto
{

/// @brief Certificate chain validation policy consumed by the handshake.
class ICertVerifier
{
public:
    virtual ~ICertVerifier() = default;

    /// @brief Validates @p leaf against the trust policy.
    ///
    /// @param leaf Server certificate.
    /// @param intermediates Untrusted certificates sent after the leaf (may be empty).
    /// @param hostname Expected server name, empty to skip the name check.
    ///
    /// @return Empty error code when the chain is trusted.
    virtual std::error_code verifyChain(X509Cert* leaf, CertStack* intermediates,
                                        std::string_view hostname) noexcept = 0;
};

} // namespace tlsh::crypto
