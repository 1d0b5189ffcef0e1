/// @file
/// @brief Declaration of the OpenSSL and X.509 verification error categories.

#pragma once
#include <string>
#include <system_error>
#include <casket/utils/singleton.hpp>

namespace tlsh::crypto
{

/// @brief Represents the error category for OpenSSL errors.
class ErrorCategory final : public casket::Singleton<ErrorCategory>,
                            public std::error_category
{
public:
    /// @brief Gets the name of the error category.
    /// @return The name of the error category.
    const char* name() const noexcept override;

    /// @brief Gets the error message corresponding to an error value.
    /// @param value The error value.
    /// @return The error message.
    std::string message(int value) const override;
};

/// @brief Represents the error category for certificate path validation results.
class VerifyErrorCategory final : public casket::Singleton<VerifyErrorCategory>,
                                  public std::error_category
{
public:
    const char* name() const noexcept override;

    std::string message(int value) const override;
};

} // namespace tlsh::crypto
