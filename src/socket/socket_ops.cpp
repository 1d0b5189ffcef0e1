#include <cerrno>
#include <system_error>

#include <unistd.h>
#include <fcntl.h>
#include <sys/socket.h>

#include <tlsh/socket/socket_ops.hpp>
#include <casket/utils/error_code.hpp>

using namespace casket;

namespace tlsh::socket
{

SocketType CreateSocket(int domain, int socktype, int protocol, std::error_code& ec)
{
    int sock = ::socket(domain, socktype, protocol);
    if (sock == InvalidSocket)
    {
        ec = GetLastSystemError();
    }

    return sock;
}

void CloseSocket(SocketType sock)
{
    if (sock != InvalidSocket)
    {
        ::close(sock);
    }
}

void Connect(SocketType sock, const SocketAddrType* addr, SocketLengthType addrlen, std::error_code& ec)
{
    if (sock == InvalidSocket)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    if (::connect(sock, addr, addrlen) == InvalidSocket)
    {
        ec = GetLastSystemError();
    }
}

size_t Send(SocketType sock, nonstd::span<const uint8_t> data, std::error_code& ec)
{
    ssize_t ret{0};
    do
    {
        ret = ::send(sock, data.data(), data.size(), MSG_NOSIGNAL);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0)
    {
        ec = GetLastSystemError();
        return 0;
    }
    return static_cast<size_t>(ret);
}

size_t Recv(SocketType sock, nonstd::span<uint8_t> buffer, std::error_code& ec)
{
    ssize_t ret{0};
    do
    {
        ret = ::recv(sock, buffer.data(), buffer.size(), 0);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0)
    {
        ec = GetLastSystemError();
        return 0;
    }
    return static_cast<size_t>(ret);
}

std::error_code GetSocketError(SocketType s)
{
    int error{0};
    SocketLengthType errorLength = sizeof(error);

    if (::getsockopt(s, SOL_SOCKET, SO_ERROR, &error, &errorLength) == InvalidSocket)
    {
        return GetLastSystemError();
    }
    if (error != 0)
    {
        return std::error_code(error, std::system_category());
    }
    return {};
}

void SetNonBlocking(SocketType s, bool value, std::error_code& ec)
{
    if (s == InvalidSocket)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    int ret = ::fcntl(s, F_GETFL, 0);
    if (ret < 0)
    {
        ec = GetLastSystemError();
    }
    else
    {
        int flag = (value ? (ret | O_NONBLOCK) : (ret & ~O_NONBLOCK));
        ret = ::fcntl(s, F_SETFL, flag);
        if (ret < 0)
        {
            ec = GetLastSystemError();
        }
    }
}

} // namespace tlsh::socket
