#pragma once
#include <array>
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/types.hpp>

namespace tlsh::tls
{

struct Finished final
{
    std::array<uint8_t, TLS_FINISHED_SIZE> verifyData{};

    static HandshakeType staticType()
    {
        return HandshakeType::FinishedCode;
    }

    static Finished deserialize(nonstd::span<const uint8_t> input);

    size_t serialize(nonstd::span<uint8_t> output) const;
};

} // namespace tlsh::tls
