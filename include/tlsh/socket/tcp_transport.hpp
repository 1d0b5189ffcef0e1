/// @file
/// @brief Declaration of the TCP transport.

#pragma once
#include <chrono>
#include <string>
#include <casket/utils/noncopyable.hpp>
#include <tlsh/tls/i_transport.hpp>
#include <tlsh/socket/types.hpp>

namespace tlsh::socket
{

/// @brief Blocking TCP stream with per-call timeouts.
class TcpTransport final : public tls::ITransport, public casket::NonCopyable
{
public:
    TcpTransport() = default;

    ~TcpTransport() noexcept;

    /// @brief Resolves @p host and connects to the first reachable address.
    ///
    /// @param[in] host Host name or literal address.
    /// @param[in] port Service port.
    /// @param[in] timeout Connect timeout per address.
    /// @param[out] ec Error code, set if no address could be reached.
    ///
    void connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout, std::error_code& ec);

    void write(nonstd::span<const uint8_t> data, std::error_code& ec) override;

    size_t read(nonstd::span<uint8_t> buffer, std::chrono::milliseconds timeout, std::error_code& ec) override;

    void close() noexcept override;

    bool isOpen() const noexcept override;

private:
    void connectTo(const AddressInfo* ai, std::chrono::milliseconds timeout, std::error_code& ec);

private:
    SocketType socket_{InvalidSocket};
};

} // namespace tlsh::socket
