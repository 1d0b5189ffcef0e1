#include <openssl/err.h>
#include <tlsh/crypto/error_code.hpp>
#include <tlsh/crypto/error_category.hpp>

namespace tlsh::crypto
{

std::error_code TranslateError(unsigned long error)
{
    if (ERR_SYSTEM_ERROR(error))
    {
        return std::error_code{static_cast<int>(ERR_GET_REASON(error)), std::system_category()};
    }

    return std::error_code{static_cast<int>(error), ErrorCategory::Instance()};
}

std::error_code GetLastError()
{
    const auto err = ::ERR_get_error();
    if (err)
        return TranslateError(err);
    return TranslateError(ERR_R_OPERATION_FAIL);
}

} // namespace tlsh::crypto

namespace tlsh::crypto::verify
{

std::error_code MakeErrorCode(Error e)
{
    return std::error_code{static_cast<int>(e), VerifyErrorCategory::Instance()};
}

} // namespace tlsh::crypto::verify
