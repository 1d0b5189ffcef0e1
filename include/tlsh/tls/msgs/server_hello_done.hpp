#pragma once
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/types.hpp>

namespace tlsh::tls
{

struct ServerHelloDone final
{
    static HandshakeType staticType()
    {
        return HandshakeType::ServerHelloDoneCode;
    }

    /// @brief Parses the message body.
    ///
    /// @throws tls::Exception (MalformedMessage) if the body is not empty.
    static ServerHelloDone deserialize(nonstd::span<const uint8_t> input);

    size_t serialize(nonstd::span<uint8_t> output) const;
};

} // namespace tlsh::tls
