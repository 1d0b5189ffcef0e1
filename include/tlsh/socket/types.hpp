#pragma once
#include <arpa/inet.h>
#include <netdb.h>

namespace tlsh::socket
{

static constexpr int InvalidSocket = -1;
typedef int SocketType;
typedef sockaddr SocketAddrType;
typedef socklen_t SocketLengthType;

typedef struct addrinfo AddressInfo;

} // namespace tlsh::socket
