#pragma once
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/types.hpp>

namespace tlsh::tls
{

/// @brief ChangeCipherSpec message. Travels in its own record type and is not a handshake message.
struct ChangeCipherSpec final
{
    static constexpr uint8_t Value = 1;

    static HandshakeType staticType()
    {
        return HandshakeType::NoneCode;
    }

    static ChangeCipherSpec deserialize(nonstd::span<const uint8_t> input);

    size_t serialize(nonstd::span<uint8_t> output) const;
};

} // namespace tlsh::tls
