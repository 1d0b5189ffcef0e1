#include <tlsh/tls/exception.hpp>
#include <tlsh/tls/error_category.hpp>

namespace tlsh::tls
{

Error Exception::error() const noexcept
{
    if (code().category() == ErrorCategory::Instance())
    {
        return static_cast<Error>(code().value());
    }
    return Error::IoError;
}

} // namespace tlsh::tls
