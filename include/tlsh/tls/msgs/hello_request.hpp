#pragma once
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/types.hpp>

namespace tlsh::tls
{

struct HelloRequest final
{
    static HandshakeType staticType()
    {
        return HandshakeType::HelloRequestCode;
    }

    static HelloRequest deserialize(nonstd::span<const uint8_t> input);

    size_t serialize(nonstd::span<uint8_t> output) const;
};

} // namespace tlsh::tls
