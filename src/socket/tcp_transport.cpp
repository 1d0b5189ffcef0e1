#include <memory>
#include <string>

#include <tlsh/socket/tcp_transport.hpp>
#include <tlsh/socket/socket_ops.hpp>
#include <tlsh/socket/select.hpp>

#include <casket/log/log_manager.hpp>

namespace tlsh::socket
{

namespace
{

struct AddressInfoDeleter
{
    void operator()(AddressInfo* ai) const noexcept
    {
        ::freeaddrinfo(ai);
    }
};

using AddressInfoPtr = std::unique_ptr<AddressInfo, AddressInfoDeleter>;

} // namespace

TcpTransport::~TcpTransport() noexcept
{
    close();
}

void TcpTransport::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
                           std::error_code& ec)
{
    close();

    AddressInfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    AddressInfo* result{nullptr};
    auto service = std::to_string(port);
    int ret = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (ret != 0)
    {
        casket::error("getaddrinfo('{}'): {}", host, ::gai_strerror(ret));
        ec = std::make_error_code(std::errc::host_unreachable);
        return;
    }
    AddressInfoPtr addresses(result);

    for (auto ai = addresses.get(); ai != nullptr; ai = ai->ai_next)
    {
        ec.clear();
        connectTo(ai, timeout, ec);
        if (!ec)
        {
            casket::debug("connected to {}:{}", host, port);
            return;
        }
        casket::debug("connect to {}:{} failed: {}", host, port, ec.message());
        close();
    }
}

void TcpTransport::connectTo(const AddressInfo* ai, std::chrono::milliseconds timeout, std::error_code& ec)
{
    socket_ = CreateSocket(ai->ai_family, ai->ai_socktype, ai->ai_protocol, ec);
    if (ec)
    {
        return;
    }

    SetNonBlocking(socket_, true, ec);
    if (ec)
    {
        return;
    }

    Connect(socket_, ai->ai_addr, ai->ai_addrlen, ec);
    if (ec == std::errc::operation_in_progress)
    {
        ec.clear();
        WaitSocket(socket_, false, timeout, ec);
        if (ec)
        {
            return;
        }
        ec = GetSocketError(socket_);
    }
    if (ec)
    {
        return;
    }

    SetNonBlocking(socket_, false, ec);
}

void TcpTransport::write(nonstd::span<const uint8_t> data, std::error_code& ec)
{
    if (!isOpen())
    {
        ec = std::make_error_code(std::errc::not_connected);
        return;
    }

    while (!data.empty())
    {
        size_t sent = Send(socket_, data, ec);
        if (ec)
        {
            return;
        }
        data = data.subspan(sent);
    }
}

size_t TcpTransport::read(nonstd::span<uint8_t> buffer, std::chrono::milliseconds timeout, std::error_code& ec)
{
    if (!isOpen())
    {
        ec = std::make_error_code(std::errc::not_connected);
        return 0;
    }

    WaitSocket(socket_, true, timeout, ec);
    if (ec)
    {
        return 0;
    }
    return Recv(socket_, buffer, ec);
}

void TcpTransport::close() noexcept
{
    CloseSocket(socket_);
    socket_ = InvalidSocket;
}

bool TcpTransport::isOpen() const noexcept
{
    return socket_ != InvalidSocket;
}

} // namespace tlsh::socket
