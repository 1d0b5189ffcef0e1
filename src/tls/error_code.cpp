#include <tlsh/tls/error_code.hpp>
#include <tlsh/tls/error_category.hpp>

namespace tlsh::tls
{

std::error_code MakeErrorCode(Error e)
{
    return std::error_code{static_cast<int>(e), ErrorCategory::Instance()};
}

} // namespace tlsh::tls
