/// @file
/// @brief Declaration of socket operations functions.

#pragma once
#include <cstdint>
#include <system_error>
#include <casket/nonstd/span.hpp>
#include <tlsh/socket/types.hpp>

namespace tlsh::socket
{

/// @brief Creates a socket and returns its descriptor.
///
/// @param domain The protocol family (e.g., AF_INET).
/// @param socktype The type of socket (e.g., SOCK_STREAM).
/// @param protocol The protocol to be used (e.g., IPPROTO_TCP).
/// @param ec Outputs the error code if socket creation fails.
///
/// @return A socket descriptor. If the creation fails, it returns an invalid socket descriptor.
SocketType CreateSocket(int domain, int socktype, int protocol, std::error_code& ec);

/// @brief Closes an open socket.
void CloseSocket(SocketType sock);

/// @brief Connects a socket to a specified address.
///
/// @param sock The socket descriptor to use for connection.
/// @param addr The destination address.
/// @param addrlen The length of the address.
/// @param ec Outputs the error code if the connection fails. A non-blocking socket reports
///           std::errc::operation_in_progress.
void Connect(SocketType sock, const SocketAddrType* addr, SocketLengthType addrlen, std::error_code& ec);

/// @brief Sends data once.
///
/// @return Number of bytes sent.
size_t Send(SocketType sock, nonstd::span<const uint8_t> data, std::error_code& ec);

/// @brief Receives data once.
///
/// @return Number of bytes received, 0 on orderly shutdown of the peer.
size_t Recv(SocketType sock, nonstd::span<uint8_t> buffer, std::error_code& ec);

/// @brief Retrieves the pending error of a socket.
std::error_code GetSocketError(SocketType s);

/// @brief Sets a socket to blocking or non-blocking mode.
///
/// @param s The socket to configure.
/// @param value Set to `true` for non-blocking, `false` for blocking.
/// @param ec Output parameter for error codes.
void SetNonBlocking(SocketType s, bool value, std::error_code& ec);

} // namespace tlsh::socket
