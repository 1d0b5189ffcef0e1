#pragma once
#include <system_error>
#include <casket/utils/noncopyable.hpp>
#include <tlsh/crypto/pointers.hpp>
#include <tlsh/crypto/cert_manager.hpp>
#include <tlsh/crypto/i_cert_verifier.hpp>

namespace tlsh::crypto
{

/// @brief Chain verifier over an OpenSSL X509_STORE.
class CertVerifier final : public ICertVerifier, public casket::NonCopyable
{
public:
    explicit CertVerifier(CertManager& manager);

    ~CertVerifier() noexcept;

    CertVerifier& setFlag(VerifyFlag flag);

    CertVerifier& clearFlag(VerifyFlag flag);

    std::error_code verifyChain(X509Cert* leaf, CertStack* intermediates,
                                std::string_view hostname) noexcept override;

private:
    CertManager& manager_;
    unsigned long flags_;
};

/// @brief Accepts any certificate. Only meant for diagnostics against servers without a usable chain.
class InsecureCertVerifier final : public ICertVerifier
{
public:
    std::error_code verifyChain(X509Cert*, CertStack*, std::string_view) noexcept override
    {
        return {};
    }
};

} // namespace tlsh::crypto
