/// @file
/// @brief Declaration of the ITransport interface.

#pragma once
#include <chrono>
#include <cstdint>
#include <system_error>
#include <casket/nonstd/span.hpp>

namespace tlsh::tls
{

/// @brief Byte stream the record layer runs over.
class ITransport
{
public:
    /// @brief Default constructor.
    ITransport() = default;

    /// @brief Virtual destructor.
    virtual ~ITransport() = default;

    /// @brief Writes the whole buffer.
    ///
    /// @param[in] data Bytes to send.
    /// @param[out] ec Error code, set on failure.
    ///
    virtual void write(nonstd::span<const uint8_t> data, std::error_code& ec) = 0;

    /// @brief Reads at most @p buffer.size() bytes.
    ///
    /// @param[out] buffer Destination buffer; its size is the read bound.
    /// @param[in] timeout Maximum time to wait for data.
    /// @param[out] ec Error code, std::errc::timed_out when nothing arrived in time.
    ///
    /// @return Number of bytes read, 0 on orderly close.
    ///
    virtual size_t read(nonstd::span<uint8_t> buffer, std::chrono::milliseconds timeout, std::error_code& ec) = 0;

    /// @brief Closes the transport. Safe to call more than once.
    virtual void close() noexcept = 0;

    virtual bool isOpen() const noexcept = 0;
};

} // namespace tlsh::tls
