#pragma once
#include <chrono>
#include <system_error>
#include <tlsh/socket/types.hpp>

namespace tlsh::socket
{

/// @brief Waits until the socket is readable (or writable) using select().
///
/// @param ec Set to std::errc::timed_out if nothing happened within @p timeout.
void WaitSocket(SocketType socket, bool read, std::chrono::milliseconds timeout, std::error_code& ec);

} // namespace tlsh::socket
