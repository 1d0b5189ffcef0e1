#include <cerrno>
#include <sys/select.h>
#include <tlsh/socket/select.hpp>
#include <casket/utils/error_code.hpp>

namespace tlsh::socket
{

void WaitSocket(SocketType socket, bool read, std::chrono::milliseconds timeout, std::error_code& ec)
{
    fd_set confds;
    struct timeval tv;

    if (socket == InvalidSocket)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    int ret{0};
    do
    {
        FD_ZERO(&confds);
        FD_SET(socket, &confds);
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

        ret = select(socket + 1, read ? &confds : nullptr, read ? nullptr : &confds, nullptr, &tv);
    } while (ret == -1 && errno == EINTR);

    if (ret == 0)
    {
        ec = std::make_error_code(std::errc::timed_out);
    }
    else if (ret == -1)
    {
        ec = casket::GetLastSystemError();
    }
}

} // namespace tlsh::socket
