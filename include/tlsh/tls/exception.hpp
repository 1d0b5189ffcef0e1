/// @file
/// @brief General exception type for TLS errors.

#pragma once

#include <string>
#include <string_view>
#include <system_error>

#include <tlsh/tls/error_code.hpp>

namespace tlsh::tls
{

/// @brief Main class for TLS exceptions.
class Exception final : public std::system_error
{
public:
    /// @brief Constructor.
    ///
    /// @param ec Error code.
    explicit Exception(std::error_code ec)
        : std::system_error(ec)
    {
    }

    /// @brief Constructor.
    ///
    /// @param ec Error code.
    /// @param what Error message.
    Exception(std::error_code ec, std::string_view what)
        : std::system_error(ec, std::string(what))
    {
    }

    /// @brief Returns the TLS error value when the code belongs to the TLS category.
    Error error() const noexcept;
};

/// @brief Throws an exception with @p error if @p exprResult is true.
///
/// @param exprResult The result of the expression to check.
/// @param error The session error to report.
/// @param msg Additional message.
inline void ThrowIfTrue(bool exprResult, Error error, std::string_view msg)
{
    if (exprResult)
    {
        throw Exception(MakeErrorCode(error), msg);
    }
}

/// @brief Throws an exception with @p error if @p exprResult is false.
///
/// @param exprResult The result of the expression to check.
/// @param error The session error to report.
/// @param msg Additional message.
inline void ThrowIfFalse(bool exprResult, Error error, std::string_view msg)
{
    ThrowIfTrue(!exprResult, error, msg);
}

} // namespace tlsh::tls
