#pragma once
#include <array>
#include <vector>
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/extensions.hpp>
#include <tlsh/tls/types.hpp>
#include <tlsh/tls/version.hpp>

namespace tlsh::tls
{

struct ServerHello final
{
    ProtocolVersion version;
    std::array<uint8_t, TLS_RANDOM_SIZE> random{};
    std::vector<uint8_t> sessionID;
    uint16_t cipherSuite{0};
    uint8_t compMethod{0};
    Extensions extensions;
    /// Extension block is written even when empty.
    bool extensionsPresent{false};

    static HandshakeType staticType()
    {
        return HandshakeType::ServerHelloCode;
    }

    /// @brief Parses the message body.
    ///
    /// @throws tls::Exception (IllegalParameter) if a compression method other than null is selected.
    static ServerHello deserialize(nonstd::span<const uint8_t> input);

    size_t serialize(nonstd::span<uint8_t> output) const;
};

} // namespace tlsh::tls
