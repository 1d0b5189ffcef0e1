#include <string>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <tlsh/crypto/cert_verifier.hpp>
#include <tlsh/crypto/error_code.hpp>

namespace tlsh::crypto
{

CertVerifier::CertVerifier(CertManager& manager)
    : manager_(manager)
    , flags_(0)
{
    setFlag(VerifyFlag::SearchTrustedFirst);
}

CertVerifier::~CertVerifier() noexcept
{
}

CertVerifier& CertVerifier::setFlag(VerifyFlag flag)
{
    flags_ |= static_cast<unsigned long>(flag);
    return *this;
}

CertVerifier& CertVerifier::clearFlag(VerifyFlag flag)
{
    flags_ &= ~static_cast<unsigned long>(flag);
    return *this;
}

std::error_code CertVerifier::verifyChain(X509Cert* leaf, CertStack* intermediates,
                                          std::string_view hostname) noexcept
{
    if (leaf == nullptr)
    {
        return verify::MakeErrorCode(verify::Error::InvalidCall);
    }

    X509StoreCtxPtr ctx(X509_STORE_CTX_new());
    if (!ctx || 0 >= X509_STORE_CTX_init(ctx, manager_.certStore(), leaf, intermediates))
    {
        return verify::MakeErrorCode(verify::Error::OutOfMemory);
    }

    auto param = X509_STORE_CTX_get0_param(ctx);
    X509_VERIFY_PARAM_set_flags(param, flags_);
    X509_STORE_CTX_set_purpose(ctx, X509_PURPOSE_SSL_SERVER);

    if (!hostname.empty())
    {
        if (0 >= X509_VERIFY_PARAM_set1_host(param, hostname.data(), hostname.size()))
        {
            return verify::MakeErrorCode(verify::Error::HostnameMismatch);
        }
    }

    if (0 >= X509_verify_cert(ctx))
    {
        int error = X509_STORE_CTX_get_error(ctx);
        return verify::MakeErrorCode(static_cast<verify::Error>(error != X509_V_OK ? error : X509_V_ERR_UNSPECIFIED));
    }

    return {};
}

} // namespace tlsh::crypto
