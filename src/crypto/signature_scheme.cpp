#include <openssl/objects.h>
#include <tlsh/crypto/signature_scheme.hpp>

namespace tlsh::crypto
{

bool SignatureScheme::isSet() const noexcept
{
    return code_ != NONE;
}

bool SignatureScheme::isSupported() const noexcept
{
    return !getKeyAlgorithm().empty();
}

bool SignatureScheme::isPSS() const noexcept
{
    return code_ == RSA_PSS_RSAE_SHA256 || code_ == RSA_PSS_RSAE_SHA384 || code_ == RSA_PSS_RSAE_SHA512;
}

std::string_view SignatureScheme::toString() const noexcept
{
    switch (code_)
    {
    case RSA_PKCS1_SHA1:
        return "rsa_pkcs1_sha1";
    case RSA_PKCS1_SHA256:
        return "rsa_pkcs1_sha256";
    case RSA_PKCS1_SHA384:
        return "rsa_pkcs1_sha384";
    case RSA_PKCS1_SHA512:
        return "rsa_pkcs1_sha512";

    case ECDSA_SHA1:
        return "ecdsa_sha1";
    case ECDSA_SHA256:
        return "ecdsa_secp256r1_sha256";
    case ECDSA_SHA384:
        return "ecdsa_secp384r1_sha384";
    case ECDSA_SHA512:
        return "ecdsa_secp521r1_sha512";

    case RSA_PSS_RSAE_SHA256:
        return "rsa_pss_rsae_sha256";
    case RSA_PSS_RSAE_SHA384:
        return "rsa_pss_rsae_sha384";
    case RSA_PSS_RSAE_SHA512:
        return "rsa_pss_rsae_sha512";

    default:
        return "unknown";
    }
}

std::string_view SignatureScheme::getHashAlgorithm() const noexcept
{
    switch (code_)
    {
    case RSA_PKCS1_SHA1:
    case ECDSA_SHA1:
        return SN_sha1;

    case RSA_PKCS1_SHA256:
    case ECDSA_SHA256:
    case RSA_PSS_RSAE_SHA256:
        return SN_sha256;

    case RSA_PKCS1_SHA384:
    case ECDSA_SHA384:
    case RSA_PSS_RSAE_SHA384:
        return SN_sha384;

    case RSA_PKCS1_SHA512:
    case ECDSA_SHA512:
    case RSA_PSS_RSAE_SHA512:
        return SN_sha512;

    default:
        break;
    }
    return {};
}

std::string_view SignatureScheme::getKeyAlgorithm() const noexcept
{
    switch (code_)
    {
    case RSA_PKCS1_SHA1:
    case RSA_PKCS1_SHA256:
    case RSA_PKCS1_SHA384:
    case RSA_PKCS1_SHA512:
    case RSA_PSS_RSAE_SHA256:
    case RSA_PSS_RSAE_SHA384:
    case RSA_PSS_RSAE_SHA512:
        return "RSA";

    case ECDSA_SHA1:
    case ECDSA_SHA256:
    case ECDSA_SHA384:
    case ECDSA_SHA512:
        return "EC";

    default:
        break;
    }
    return {};
}

} // namespace tlsh::crypto
