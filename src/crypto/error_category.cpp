#include <openssl/err.h>
#include <openssl/x509.h>
#include <tlsh/crypto/error_category.hpp>

namespace tlsh::crypto
{

const char* ErrorCategory::name() const noexcept
{
    return "OpenSSL";
}

std::string ErrorCategory::message(int value) const
{
    const char* reason = ::ERR_reason_error_string(value);
    if (reason)
    {
        const char* lib = ::ERR_lib_error_string(value);
        std::string result(reason);
        if (lib)
        {
            result += " (";
            result += lib;
            result += ")";
        }
        return result;
    }

    return "OpenSSL error";
}

const char* VerifyErrorCategory::name() const noexcept
{
    return "X509";
}

std::string VerifyErrorCategory::message(int value) const
{
    return ::X509_verify_cert_error_string(value);
}

} // namespace tlsh::crypto
