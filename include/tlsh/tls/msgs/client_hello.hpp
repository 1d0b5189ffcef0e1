#pragma once
#include <array>
#include <vector>
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/extensions.hpp>
#include <tlsh/tls/types.hpp>
#include <tlsh/tls/version.hpp>

namespace tlsh::tls
{

struct ClientHello final
{
    ProtocolVersion version;
    std::array<uint8_t, TLS_RANDOM_SIZE> random{};
    std::vector<uint8_t> sessionID;
    std::vector<uint16_t> suites;
    std::vector<uint8_t> compMethods;
    Extensions extensions;
    /// Extension block is written even when empty.
    bool extensionsPresent{false};

    static HandshakeType staticType()
    {
        return HandshakeType::ClientHelloCode;
    }

    bool offeredSuite(uint16_t suite) const;

    static ClientHello deserialize(nonstd::span<const uint8_t> input);

    size_t serialize(nonstd::span<uint8_t> output) const;
};

} // namespace tlsh::tls
